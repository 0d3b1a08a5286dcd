/**
 * @file snapshot.hpp
 * @brief Deep-copy snapshots of a document and a bounded undo history.
 *
 * Usage:
 * @code
 *   auto history = iniedit::DocumentSnapshot::Create(doc, 20);
 *   history.value().TakeSnapshot();
 *   doc.RemoveSection("cache");
 *   history.value().Undo();   // "cache" is back
 * @endcode
 */

#ifndef INIEDIT_SNAPSHOT_HPP_
#define INIEDIT_SNAPSHOT_HPP_

#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstddef>
#include <deque>
#include <utility>

namespace iniedit {

inline Document CreateSnapshot(const Document& source) { return source.Clone(); }

/**
 * @brief Replace the content of @p target with copies of @p snapshot's
 *        default-section properties and sections.
 *
 * The target's comment prefixes are kept.
 */
inline void RestoreFromSnapshot(Document& target, const Document& snapshot) {
  target.Clear();
  for (const auto& prop : snapshot.DefaultSection()) {
    (void)target.DefaultSection().AddProperty(prop.Clone());
  }
  for (const auto& sec : snapshot) {
    (void)target.AddSection(sec.Clone());
  }
}

/**
 * @brief LIFO history of snapshots bound to one document.
 *
 * Holds a reference to the document; the document must outlive it. When
 * more than max_snapshots are taken the oldest is dropped.
 */
class DocumentSnapshot final {
 public:
  static constexpr size_t kDefaultMaxSnapshots = 10;

  /// Fails with kInvalidArgument when @p max_snapshots is 0.
  static expected<DocumentSnapshot, IniError> Create(
      Document& document, size_t max_snapshots = kDefaultMaxSnapshots) {
    if (max_snapshots < 1) {
      return expected<DocumentSnapshot, IniError>::error(
          IniError::kInvalidArgument);
    }
    return expected<DocumentSnapshot, IniError>::success(
        DocumentSnapshot(document, max_snapshots));
  }

  DocumentSnapshot(DocumentSnapshot&&) = default;
  DocumentSnapshot(const DocumentSnapshot&) = delete;
  DocumentSnapshot& operator=(const DocumentSnapshot&) = delete;

  Document& Current() noexcept { return *current_; }
  size_t SnapshotCount() const noexcept { return snapshots_.size(); }
  size_t MaxSnapshots() const noexcept { return max_snapshots_; }
  bool CanUndo() const noexcept { return !snapshots_.empty(); }

  void TakeSnapshot() {
    snapshots_.push_front(CreateSnapshot(*current_));
    while (snapshots_.size() > max_snapshots_) {
      snapshots_.pop_back();
    }
  }

  /// @brief Restore the most recent snapshot. False when there is none.
  bool Undo() {
    if (!CanUndo()) return false;
    Document latest = std::move(snapshots_.front());
    snapshots_.pop_front();
    RestoreFromSnapshot(*current_, latest);
    INIEDIT_LOG_DEBUG("Snapshot", "undo, %zu snapshot(s) left",
                      snapshots_.size());
    return true;
  }

  void Clear() noexcept { snapshots_.clear(); }

 private:
  DocumentSnapshot(Document& document, size_t max_snapshots)
      : current_(&document), max_snapshots_(max_snapshots) {}

  Document* current_;
  size_t max_snapshots_;
  std::deque<Document> snapshots_;
};

}  // namespace iniedit

#endif  // INIEDIT_SNAPSHOT_HPP_
