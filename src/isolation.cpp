#include "jobtree/isolation.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/log.hpp"
#include "jobtree/registry.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/util.hpp"
#include "jobtree/worktree.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;
namespace jfs = jobtree::fs;

namespace jobtree {

void validate_redirect_path(std::string_view rel) {
  const stdfs::path p{rel};
  if (rel.empty() || p.is_absolute() || p.has_root_path()) {
    throw SymlinkConflict("redirect path must be relative: '" + std::string(rel) + "'");
  }
  for (const auto &part : p) {
    if (part == "..") {
      throw SymlinkConflict("redirect path escapes the tree: '" + std::string(rel) + "'");
    }
  }
}

namespace {

// Replace whatever the checkout put at `<view>/<rel>` with a link to the
// originating tree. Nothing is removed or created until both ends are known
// to stay inside their trees.
auto install_redirect(const stdfs::path &view, const stdfs::path &origin,
                      const stdfs::path &canonical_origin, const std::string &rel)
    -> RedirectLink {
  validate_redirect_path(rel);
  const stdfs::path rel_path = stdfs::path(rel).lexically_normal();
  RedirectLink link{.rel = rel, .link = view / rel_path, .target = origin / rel_path};

  if (!jfs::is_within(link.target, canonical_origin)) {
    throw SymlinkConflict("redirect target resolves outside " + origin.string() + ": " +
                          link.target.string());
  }
  // A checked-out symlink along the way would point the removal elsewhere.
  if (!jfs::is_within(link.link.parent_path(), view)) {
    throw SymlinkConflict("redirect path leaves the view through a symlink: " +
                          link.link.string());
  }

  std::error_code ec;
  if (stdfs::exists(stdfs::symlink_status(link.link, ec))) {
    if (const auto rm = jfs::remove_tree(link.link)) {
      throw SymlinkConflict("cannot clear " + link.link.string() + ": " + rm.message());
    }
  }

  if (!stdfs::is_directory(link.target, ec)) {
    if (stdfs::exists(stdfs::symlink_status(link.target, ec)) &&
        !stdfs::is_symlink(stdfs::symlink_status(link.target, ec))) {
      throw SymlinkConflict("redirect target exists and is not a directory: " +
                            link.target.string());
    }
    stdfs::create_directories(link.target, ec);
    if (ec) {
      throw SymlinkConflict("cannot create " + link.target.string() + ": " + ec.message());
    }
  }

  stdfs::create_directories(link.link.parent_path(), ec);
  if (!ec) {
    stdfs::create_directory_symlink(link.target, link.link, ec);
  }
  if (ec) {
    throw SymlinkConflict("cannot link " + link.link.string() + " -> " + link.target.string() +
                          ": " + ec.message());
  }
  return link;
}

} // namespace

IsolationProvisioner::IsolationProvisioner(stdfs::path tree_root)
    : tree_root_(std::move(tree_root)) {}

auto IsolationProvisioner::default_base_dir() const -> stdfs::path {
  return stdfs::absolute(tree_root_).lexically_normal().parent_path();
}

auto IsolationProvisioner::provision(const RevisionRecord &revision, std::string_view job_id,
                                     const std::optional<stdfs::path> &base_dir,
                                     const std::vector<std::string> &redirect_paths)
    -> IsolatedView {
  const Repository repo{tree_root_};
  const WorktreeRegistry registry{repo};

  IsolatedView view{};
  view.job_id = std::string(job_id);
  view.revision = revision.id;
  view.origin_root = stdfs::absolute(tree_root_).lexically_normal();

  bool registered = false;
  const auto rollback = [&]() {
    if (registered) {
      try {
        const auto held = registry.lock();
        registry.remove(held, view.worktree_name);
      } catch (const std::exception &e) {
        log::warn(log::tag::kIsolation, "rollback: deregister ", view.worktree_name,
                  " failed: ", e.what());
      }
    }
    if (!view.container.empty()) {
      if (const auto ec = jfs::remove_tree(view.container)) {
        log::warn(log::tag::kIsolation, "rollback: remove ", view.container.string(),
                  " failed: ", ec.message());
      }
    }
  };

  try {
    if (!repo.is_initialized()) {
      throw std::runtime_error("not an initialized jobtree store: " + tree_root_.string());
    }
    if (!looks_hex40(revision.commit)) {
      throw std::runtime_error("revision " + revision.id + " has no commit");
    }
    const auto base = base_dir.value_or(default_base_dir());
    view.container = jfs::make_unique_dir(base, consts::kViewContainerPrefix);
    view.path = view.container / consts::kViewCodeDir;

    const std::string suffix =
        view.container.filename().string().substr(consts::kViewContainerPrefix.size());
    view.worktree_name = revision.id + "-job" + view.job_id + "-" + suffix;

    std::optional<Repository> checkout;
    {
      const auto held = registry.lock();
      checkout.emplace(registry.add(held, view.worktree_name, view.path, revision.commit));
      registered = true;
    }
    worktree::materialize_commit(*checkout, revision.commit);
  } catch (const std::exception &e) {
    rollback();
    throw WorktreeCreationFailure("job " + view.job_id + ": cannot create view of " +
                                  revision.id + ": " + e.what());
  }

  try {
    std::error_code ec;
    const auto canonical_origin = stdfs::canonical(view.origin_root, ec);
    if (ec) {
      throw SymlinkConflict("cannot resolve " + view.origin_root.string() + ": " + ec.message());
    }
    for (const auto &rel : redirect_paths) {
      view.redirects.push_back(
          install_redirect(view.path, view.origin_root, canonical_origin, rel));
    }
  } catch (const SymlinkConflict &) {
    rollback();
    throw;
  } catch (const std::exception &e) {
    rollback();
    throw SymlinkConflict("job " + view.job_id + ": " + e.what());
  }

  log::info(log::tag::kIsolation, "job ", view.job_id, " view ", view.path.string(), " at ",
            revision.id, " (", view.redirects.size(), " redirect(s))");
  return view;
}

} // namespace jobtree
