#include "jobtree/cleanup.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/log.hpp"
#include "jobtree/repo.hpp"

#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;
namespace jfs = jobtree::fs;

namespace jobtree {

CleanupCoordinator::CleanupCoordinator(stdfs::path tree_root) : tree_root_(std::move(tree_root)) {}

void CleanupCoordinator::release(const IsolatedView &view) {
  std::vector<std::string> problems;

  for (const auto &r : view.redirects) {
    std::error_code ec;
    if (stdfs::is_symlink(stdfs::symlink_status(r.link, ec))) {
      stdfs::remove(r.link, ec);
      if (ec) {
        problems.push_back("unlink " + r.link.string() + ": " + ec.message());
      }
    }
  }

  if (!view.container.empty()) {
    if (view.container.filename().string().starts_with(consts::kViewContainerPrefix)) {
      if (const auto ec = jfs::remove_tree(view.container)) {
        problems.push_back("remove " + view.container.string() + ": " + ec.message());
      }
    } else {
      problems.push_back("refusing to remove " + view.container.string() +
                         ": not a view container");
    }
  }

  if (!view.worktree_name.empty()) {
    try {
      const Repository repo{tree_root_};
      const WorktreeRegistry registry{repo};
      const auto held = registry.lock();
      registry.remove(held, view.worktree_name);
    } catch (const std::exception &e) {
      problems.push_back("deregister " + view.worktree_name + ": " + e.what());
    }
  }

  if (!problems.empty()) {
    std::string msg = "release of job " + view.job_id + " view incomplete";
    for (const auto &p : problems) {
      msg += "; " + p;
    }
    throw CleanupFailure(msg);
  }
  log::debug(log::tag::kCleanup, "released job ", view.job_id, " view ", view.path.string());
}

void CleanupCoordinator::release_path(const stdfs::path &view_path) {
  const Repository repo{tree_root_};
  const WorktreeRegistry registry{repo};
  const auto rec = registry.find_by_path(view_path);
  if (!rec) {
    throw CleanupFailure("not a registered view: " + view_path.string());
  }
  // remove_all never follows the redirect links, so removing the container
  // takes them along.
  IsolatedView view{};
  view.path = rec->path;
  view.container = rec->path.parent_path();
  view.origin_root = tree_root_;
  view.worktree_name = rec->name;
  view.job_id = rec->name;
  release(view);
}

auto CleanupCoordinator::list() const -> std::vector<WorktreeRecord> {
  const Repository repo{tree_root_};
  return WorktreeRegistry{repo}.list();
}

auto CleanupCoordinator::prune() -> std::vector<std::string> {
  const Repository repo{tree_root_};
  const WorktreeRegistry registry{repo};
  const auto held = registry.lock();
  return registry.prune(held);
}

} // namespace jobtree
