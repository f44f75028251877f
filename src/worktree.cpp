#include "jobtree/worktree.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/ignore.hpp"
#include "jobtree/index.hpp"
#include "jobtree/repo.hpp"

#include <filesystem>
#include <stdexcept>

namespace stdfs = std::filesystem;
namespace jfs = jobtree::fs;

namespace jobtree::worktree {

// Rules are taken by value: each directory level sees its ancestors' rules
// plus its own, and siblings never see each other's.
static void walk(const stdfs::path &root, const std::string &rel_dir, IgnoreRules rules,
                 PathSet &out) {
  rules.load_dir(root, rel_dir);
  const auto dir = rel_dir.empty() ? root : root / rel_dir;
  for (const auto &e : stdfs::directory_iterator(dir)) {
    const std::string name = e.path().filename().string();
    if (name == consts::kStoreDir) {
      continue;
    }
    const std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;
    const auto st = e.symlink_status();
    const bool is_dir = stdfs::is_directory(st);
    if (rules.is_ignored(rel, is_dir)) {
      continue;
    }
    if (is_dir) {
      walk(root, rel, rules, out);
    } else if (stdfs::is_regular_file(st) || stdfs::is_symlink(st)) {
      out.insert(rel);
    }
  }
}

void enumerate_paths(const stdfs::path &root, PathSet &out_paths, const PathSet &keep) {
  walk(root, {}, IgnoreRules{}, out_paths);
  for (const auto &p : keep) {
    if (out_paths.contains(p)) {
      continue;
    }
    std::error_code ec;
    const auto st = stdfs::symlink_status(root / p, ec);
    if (!ec && (stdfs::is_regular_file(st) || stdfs::is_symlink(st))) {
      out_paths.insert(p);
    }
  }
}

std::uint32_t mode_of(const stdfs::path &p) {
  const auto st = stdfs::symlink_status(p);
  if (stdfs::is_symlink(st)) {
    return consts::kModeSymlink;
  }
  return jfs::is_executable(st.permissions()) ? consts::kModeExec : consts::kModeFile;
}

std::vector<std::uint8_t> blob_bytes(const stdfs::path &p, std::uint32_t mode) {
  if (mode == consts::kModeSymlink) {
    const std::string target = stdfs::read_symlink(p).string();
    return {target.begin(), target.end()};
  }
  return jfs::read_file(p);
}

Snapshot index_to_map(const Repository &repo) {
  Snapshot m;
  Index idx{repo};
  idx.load();
  for (const auto &e : idx.entries())
    m[e.path] = Entry{.mode = e.mode, .hex = to_hex(e.id)};
  return m;
}

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, Snapshot &out) {
  for (auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = Entry{.mode = e.mode, .hex = to_hex(e.id)};
  }
}

Snapshot tree_to_map(const Repository &repo, const std::string &tree_hex) {
  Snapshot m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

void apply_snapshot(const Repository &repo, const Snapshot &snapshot) {
  const auto &root = repo.root();
  PathSet working_paths;
  enumerate_paths(root, working_paths);
  for (const auto &p : working_paths) {
    if (!snapshot.contains(p))
      stdfs::remove(root / p);
  }
  for (const auto &[path, entry] : snapshot) {
    const auto dst = root / path;
    const auto bytes = repo.read_blob(entry.hex);
    if (entry.mode == consts::kModeSymlink) {
      jfs::ensure_parent_dir(dst);
      std::error_code ec;
      stdfs::remove(dst, ec);
      stdfs::create_symlink(std::string(bytes.begin(), bytes.end()), dst);
      continue;
    }
    jfs::write_file_atomic(dst, bytes);
    if (entry.mode == consts::kModeExec) {
      stdfs::permissions(dst,
                         stdfs::perms::owner_exec | stdfs::perms::group_exec |
                             stdfs::perms::others_exec,
                         stdfs::perm_options::add);
    }
  }
}

void write_index_snapshot(const Repository &repo, const Snapshot &snapshot) {
  std::vector<IndexEntry> entries;
  entries.reserve(snapshot.size());
  for (const auto &[path, entry] : snapshot) {
    IndexEntry e{.mode = entry.mode, .id = {}, .path = path};
    if (!from_hex(entry.hex, e.id)) {
      throw std::runtime_error("bad blob id in snapshot: " + entry.hex);
    }
    entries.push_back(std::move(e));
  }
  Index idx{repo};
  idx.assign(std::move(entries));
  idx.save();
}

void materialize_commit(const Repository &repo, const std::string &commit_hex) {
  const auto info = repo.read_commit(commit_hex);
  if (info.tree_hex.size() != consts::kOidHexLen) {
    throw std::runtime_error("commit missing tree: " + commit_hex);
  }
  const auto snapshot = tree_to_map(repo, info.tree_hex);
  apply_snapshot(repo, snapshot);
  write_index_snapshot(repo, snapshot);
}

std::size_t mirror_tree(const stdfs::path &src, const stdfs::path &dst, const PathSet &keep) {
  PathSet src_paths;
  enumerate_paths(src, src_paths, keep);
  PathSet dst_paths;
  enumerate_paths(dst, dst_paths);

  // Deletions first, so that a file replaced by a directory of the same name
  // is out of the way before the copy.
  for (const auto &p : dst_paths) {
    if (!src_paths.contains(p)) {
      stdfs::remove(dst / p);
    }
  }
  for (const auto &p : src_paths) {
    jfs::copy_entry(src / p, dst / p);
  }
  return src_paths.size();
}

} // namespace jobtree::worktree
