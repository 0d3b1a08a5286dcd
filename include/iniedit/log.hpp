/**
 * @file log.hpp
 * @brief Lightweight synchronous logging with printf-style macros.
 *
 * Output format:
 *   [2026-01-01 12:00:00.123] [INFO] [Parser] message (file.hpp:42)
 *
 * The file/line suffix is omitted in NDEBUG builds.
 *
 * Compile-time configuration:
 *   INIEDIT_LOG_MIN_LEVEL -- macros below this level compile to nothing
 *                            (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=OFF)
 *
 * Runtime level defaults to kInfo; SetLevel(Level::kDebug) enables parser tracing.
 */

#ifndef INIEDIT_LOG_HPP_
#define INIEDIT_LOG_HPP_

#include "iniedit/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#ifndef INIEDIT_LOG_MIN_LEVEL
#ifdef NDEBUG
#define INIEDIT_LOG_MIN_LEVEL 1
#else
#define INIEDIT_LOG_MIN_LEVEL 0
#endif
#endif

namespace iniedit {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kOff = 4,
};

namespace detail {

struct LogState {
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;
  FILE* sink = nullptr;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kOff:   return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::tm tm_buf{};
#if defined(INIEDIT_PLATFORM_WINDOWS)
  (void)localtime_s(&tm_buf, &secs);
#else
  (void)localtime_r(&secs, &tm_buf);
#endif
  size_t len = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + len, size - len, ".%03d", static_cast<int>(ms));
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::State().level.load(std::memory_order_relaxed));
}

/// @brief Redirect output to @p sink (nullptr restores stderr).
inline void Init(FILE* sink = nullptr) noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.write_mutex);
  st.sink = sink;
  st.initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.write_mutex);
  if (st.sink != nullptr) {
    (void)std::fflush(st.sink);
  }
  st.sink = nullptr;
  st.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  if (GetLevel() == Level::kOff) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.write_mutex);
  FILE* out = (st.sink != nullptr) ? st.sink : stderr;
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level),
                     category, msg);
#else
  (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

INIEDIT_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace iniedit

// ============================================================================
// Logging Macros
// ============================================================================

#define INIEDIT_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                      \
    if (INIEDIT_LOG_MIN_LEVEL <= 0) {                                       \
      ::iniedit::log::LogWrite(::iniedit::log::Level::kDebug, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define INIEDIT_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                      \
    if (INIEDIT_LOG_MIN_LEVEL <= 1) {                                       \
      ::iniedit::log::LogWrite(::iniedit::log::Level::kInfo, cat,           \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define INIEDIT_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                      \
    if (INIEDIT_LOG_MIN_LEVEL <= 2) {                                       \
      ::iniedit::log::LogWrite(::iniedit::log::Level::kWarn, cat,           \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define INIEDIT_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                      \
    if (INIEDIT_LOG_MIN_LEVEL <= 3) {                                       \
      ::iniedit::log::LogWrite(::iniedit::log::Level::kError, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#endif  // INIEDIT_LOG_HPP_
