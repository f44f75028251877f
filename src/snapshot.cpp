#include "jobtree/snapshot.hpp"

#include "jobtree/config.hpp"
#include "jobtree/consts.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/index.hpp"
#include "jobtree/log.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/registry.hpp"
#include "jobtree/remote.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/time.hpp"
#include "jobtree/util.hpp"
#include "jobtree/worktree.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;
namespace jfs = jobtree::fs;

namespace jobtree {

namespace {

constexpr std::string_view kSnapshotSubject = "Snapshot ";
constexpr std::string_view kRevisionTrailer = "Jobtree-Revision: ";

// Did this revision's own capture write the commit? Clean-tree captures reuse
// HEAD, whose message carries no trailer for this id.
bool committed_by_capture(std::string_view message, std::string_view id) {
  const std::string line = std::string(kRevisionTrailer) + std::string(id);
  for (std::size_t pos = 0; pos < message.size();) {
    const auto end = std::min(message.find('\n', pos), message.size());
    if (message.substr(pos, end - pos) == line) {
      return true;
    }
    pos = end + 1;
  }
  return false;
}

bool name_taken(const Repository &repo, const WorktreeRegistry &registry,
                const std::string &name) {
  return read_ref(repo, heads_ref(name)).has_value() || registry.contains(name);
}

// prefix-stamp, then prefix-stamp-micros, then prefix-stamp-micros-N
auto reserve_name(const Repository &repo, const WorktreeRegistry &registry,
                  std::string_view prefix, std::chrono::system_clock::time_point now)
    -> std::string {
  std::string name = std::string(prefix) + "-" + timeutil::utc_stamp(now);
  if (!name_taken(repo, registry, name)) {
    return name;
  }
  name += "-" + timeutil::micros_stamp(now);
  if (!name_taken(repo, registry, name)) {
    return name;
  }
  for (int n = 1;; ++n) {
    std::string candidate = name + "-" + std::to_string(n);
    if (!name_taken(repo, registry, candidate)) {
      return candidate;
    }
  }
}

// Paths the side worktree must keep tracking even when an ignore rule
// matches them: everything in the base commit and in the user's index.
auto tracked_snapshot(const Repository &repo, const std::optional<std::string> &base)
    -> worktree::Snapshot {
  worktree::Snapshot tracked;
  if (base) {
    tracked = worktree::tree_to_map(repo, repo.read_commit(*base).tree_hex);
  }
  for (auto &[path, entry] : worktree::index_to_map(repo)) {
    tracked.insert_or_assign(path, std::move(entry));
  }
  return tracked;
}

} // namespace

auto RevisionRecord::branch_ref() const -> std::string { return heads_ref(id); }

SnapshotManager::SnapshotManager(stdfs::path tree_root) : tree_root_(std::move(tree_root)) {}

auto SnapshotManager::create_revision(std::string_view prefix, bool publish) -> RevisionRecord {
  const Repository repo{tree_root_};
  if (!repo.is_initialized()) {
    throw SnapshotCreationFailure("not an initialized jobtree store: " + tree_root_.string());
  }
  if (prefix.empty()) {
    throw SnapshotCreationFailure("empty revision prefix");
  }

  const WorktreeRegistry registry{repo};
  const auto now = std::chrono::system_clock::now();

  RevisionRecord rec{};
  rec.tree_root = tree_root_;
  rec.created_at = now;

  stdfs::path container;
  bool registered = false;
  bool ref_reserved = false;

  try {
    const auto base = repo.head_commit();
    rec.base_commit = base.value_or("");

    container = jfs::make_unique_dir(stdfs::temp_directory_path(), consts::kSideContainerPrefix);
    const auto side_root = container / "tree";

    std::optional<Repository> side;
    {
      const auto held = registry.lock();
      rec.id = reserve_name(repo, registry, prefix, now);
      if (base) {
        update_ref(repo, heads_ref(rec.id), *base);
        ref_reserved = true;
      }
      side.emplace(registry.add(held, rec.id, side_root,
                                std::string(consts::kRefPrefix) + heads_ref(rec.id)));
      registered = true;
    }
    log::debug(log::tag::kSnapshot, "side worktree for ", rec.id, " at ", side_root.string());

    // Seed the side index with the tracked set, then mirror and add -A.
    const auto tracked = tracked_snapshot(repo, base);
    worktree::write_index_snapshot(*side, tracked);
    worktree::PathSet keep;
    for (const auto &[path, entry] : tracked) {
      keep.insert(path);
    }
    const auto mirrored = worktree::mirror_tree(tree_root_, side_root, keep);

    Index idx{*side};
    idx.load();
    const auto staged = idx.stage_all();
    idx.save();

    const std::string tree_hex = side->write_tree_from_index();
    const std::string base_tree = base ? repo.read_commit(*base).tree_hex : std::string{};
    if (!base || tree_hex != base_tree) {
      const std::string message = std::string(kSnapshotSubject) + timeutil::utc_stamp(now) +
                                  "\n\n" + std::string(kRevisionTrailer) + rec.id + "\n";
      rec.commit = side->commit_index(message);
      ref_reserved = true;
    } else {
      rec.commit = *base;
    }
    log::info(log::tag::kSnapshot, "captured ", rec.id, " (", strutil::abbrev(rec.commit), ", ",
              staged, " file(s), ", mirrored, " mirrored",
              rec.commit == rec.base_commit ? ", clean tree" : "", ")");
  } catch (const std::exception &e) {
    // Roll back everything this call created.
    try {
      const auto held = registry.lock();
      if (registered) {
        registry.remove(held, rec.id);
      }
      if (ref_reserved) {
        delete_ref(repo, heads_ref(rec.id));
      }
    } catch (const std::exception &inner) {
      log::warn(log::tag::kSnapshot, "rollback of ", rec.id, " incomplete: ", inner.what());
    }
    if (!container.empty()) {
      if (const auto ec = jfs::remove_tree(container)) {
        log::warn(log::tag::kSnapshot, "could not remove ", container.string(), ": ",
                  ec.message());
      }
    }
    throw SnapshotCreationFailure(std::string("snapshot of ") + tree_root_.string() +
                                  " failed: " + e.what());
  }

  // The revision is complete; failing to drop the side worktree only leaks it.
  try {
    const auto held = registry.lock();
    registry.remove(held, rec.id);
  } catch (const std::exception &e) {
    log::warn(log::tag::kSnapshot, "could not deregister side worktree ", rec.id, ": ",
              e.what());
  }
  if (const auto ec = jfs::remove_tree(container)) {
    log::warn(log::tag::kSnapshot, "could not remove ", container.string(), ": ", ec.message());
  }

  if (publish) {
    try {
      const auto remote = remote_location(read_config(repo.config_file()));
      if (!remote) {
        throw PushFailure("no remote '" + std::string(consts::kDefaultRemote) + "' configured");
      }
      remote::publish_branch(repo, *remote, rec.id);
      rec.published = true;
    } catch (const PushFailure &e) {
      log::warn(log::tag::kRemote, e.what());
    }
  }
  return rec;
}

auto SnapshotManager::find_revision(std::string_view id) const -> std::optional<RevisionRecord> {
  const Repository repo{tree_root_};
  const auto tip = read_ref(repo, heads_ref(id));
  if (!tip || !looks_hex40(*tip)) {
    return std::nullopt;
  }
  const auto info = repo.read_commit(*tip);

  RevisionRecord rec{};
  rec.id = std::string(id);
  rec.commit = *tip;
  rec.tree_root = tree_root_;
  if (committed_by_capture(info.message, id)) {
    rec.base_commit = info.parents.empty() ? std::string{} : info.parents.front();
  } else {
    rec.base_commit = *tip; // captured from a clean tree
  }
  if (const auto t = timeutil::signature_time(info.committer)) {
    rec.created_at = std::chrono::system_clock::from_time_t(*t);
  }
  return rec;
}

auto SnapshotManager::list_revisions(std::string_view prefix) const
    -> std::vector<RevisionRecord> {
  const Repository repo{tree_root_};
  std::vector<RevisionRecord> out;
  for (const auto &name : list_branches(repo, prefix)) {
    if (auto rec = find_revision(name)) {
      out.push_back(std::move(*rec));
    }
  }
  return out;
}

} // namespace jobtree
