#pragma once
#include "jobtree/snapshot.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

// `<view>/<rel>` is a symlink to `<origin>/<rel>`.
struct RedirectLink {
  std::string rel;
  std::filesystem::path link;
  std::filesystem::path target;
};

// One job's private checkout of a revision. Owned by that job until released.
struct IsolatedView {
  std::filesystem::path path;      // <container>/code
  std::filesystem::path container; // mkdtemp directory, removed on release
  std::filesystem::path origin_root;
  std::string job_id;
  std::string worktree_name; // registry name in the originating store
  std::string revision;      // RevisionRecord::id
  std::vector<RedirectLink> redirects;
};

class IsolationProvisioner {
public:
  explicit IsolationProvisioner(std::filesystem::path tree_root);

  // Parent directory of the originating tree.
  [[nodiscard]] auto default_base_dir() const -> std::filesystem::path;

  // Check `revision` out into a fresh container under `base_dir` (default:
  // default_base_dir()) and point every redirect path back at the originating
  // tree. Throws WorktreeCreationFailure or SymlinkConflict after removing
  // whatever the call created.
  auto provision(const RevisionRecord &revision, std::string_view job_id,
                 const std::optional<std::filesystem::path> &base_dir,
                 const std::vector<std::string> &redirect_paths) -> IsolatedView;

private:
  std::filesystem::path tree_root_;
};

// Relative, non-empty and free of ".." components; throws SymlinkConflict.
void validate_redirect_path(std::string_view rel);

} // namespace jobtree
