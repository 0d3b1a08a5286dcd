/**
 * @file platform.hpp
 * @brief Library version, compiler attributes and the internal assertion
 *        macro.
 */

#ifndef INIEDIT_PLATFORM_HPP_
#define INIEDIT_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#define INIEDIT_VERSION_MAJOR 1
#define INIEDIT_VERSION_MINOR 0
#define INIEDIT_VERSION_PATCH 0

/// Lets GCC/Clang check printf-style arguments of the logging functions.
#if defined(__GNUC__) || defined(__clang__)
#define INIEDIT_PRINTF_FORMAT(fmt_idx, args_idx) \
  __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define INIEDIT_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

namespace iniedit {
namespace detail {

/// Internal invariant broken: report and stop.
[[noreturn]] inline void AssertFail(const char* cond, const char* file,
                                    int line) {
  (void)std::fprintf(stderr, "iniedit: assertion '%s' failed (%s:%d)\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail
}  // namespace iniedit

/// Checks internal invariants only; compiled out under NDEBUG.
#ifdef NDEBUG
#define INIEDIT_ASSERT(cond) ((void)0)
#else
#define INIEDIT_ASSERT(cond)                                             \
  ((cond) ? static_cast<void>(0)                                         \
          : ::iniedit::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // INIEDIT_PLATFORM_HPP_
