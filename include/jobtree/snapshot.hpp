#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

// One captured tree state, stored as branch `refs/heads/<id>` of the
// originating store. Shared read-only by every job of a batch.
struct RevisionRecord {
  std::string id;          // "<prefix>-<UTC %Y%m%d-%H%M%S>[-<micros>][-<n>]"
  std::string commit;      // captured state
  std::string base_commit; // HEAD of the originating tree at capture, "" if unborn
  std::filesystem::path tree_root;
  std::chrono::system_clock::time_point created_at;
  bool published = false;

  [[nodiscard]] auto branch_ref() const -> std::string;
};

class SnapshotManager {
public:
  explicit SnapshotManager(std::filesystem::path tree_root);

  [[nodiscard]] const std::filesystem::path &tree_root() const { return tree_root_; }

  // Capture tracked, staged, unstaged and untracked (non-ignored) files of the
  // tree into a new revision through a throwaway side worktree. The user's
  // HEAD, index and files are only read. With `publish`, the branch is pushed
  // to `remote.origin`; a failed push is only logged.
  // Throws SnapshotCreationFailure; nothing created by the call survives it.
  auto create_revision(std::string_view prefix, bool publish) -> RevisionRecord;

  [[nodiscard]] auto find_revision(std::string_view id) const -> std::optional<RevisionRecord>;

  // Revisions whose id starts with `prefix`, oldest id first.
  [[nodiscard]] auto list_revisions(std::string_view prefix = {}) const
      -> std::vector<RevisionRecord>;

private:
  std::filesystem::path tree_root_;
};

} // namespace jobtree
