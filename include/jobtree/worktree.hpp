#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace jobtree {

class Repository; // fwd

namespace worktree {

struct Entry {
  std::uint32_t mode;
  std::string hex; // 40-hex blob id
};

using Snapshot = std::map<std::string, Entry>; // repo-relative path -> entry
using PathSet = std::set<std::string>;

// Non-directory entries (regular files and symlinks, never followed) under
// root as repo-relative paths. The store marker is always skipped, ignore
// rules are honoured, and every path in `keep` that exists is included even
// when ignored.
void enumerate_paths(const std::filesystem::path &root, PathSet &out_paths,
                     const PathSet &keep = {});

// Mode for a working file: symlink, executable or regular
auto mode_of(const std::filesystem::path &p) -> std::uint32_t;

// Blob payload for a working file (link target for symlinks)
auto blob_bytes(const std::filesystem::path &p, std::uint32_t mode) -> std::vector<std::uint8_t>;

auto index_to_map(const Repository &repo) -> Snapshot;

// Flatten a tree object (recursive)
auto tree_to_map(const Repository &repo, const std::string &tree_hex) -> Snapshot;

// Make the working directory match the snapshot (extra files removed)
void apply_snapshot(const Repository &repo, const Snapshot &snapshot);

// Rewrite the index from snapshot entries
void write_index_snapshot(const Repository &repo, const Snapshot &snapshot);

// Check out `commit_hex` into repo.root(): files plus index.
void materialize_commit(const Repository &repo, const std::string &commit_hex);

// rsync -a --delete from `src` to `dst`: copies every path enumerate_paths()
// yields for src and removes files under dst that src does not have. The
// store marker of dst is never touched. Returns the number of copied entries.
auto mirror_tree(const std::filesystem::path &src, const std::filesystem::path &dst,
                 const PathSet &keep = {}) -> std::size_t;

} // namespace worktree

} // namespace jobtree
