#pragma once
#include "jobtree/consts.hpp"
#include "jobtree/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

class Repository; // fwd decl to avoid header cycle

struct IndexEntry {
  std::uint32_t mode; // consts::kModeFile, kModeExec or kModeSymlink
  oid id;             // blob id (20 bytes)
  std::string path;   // "dir/file", UTF-8, no leading '/'
};

// Staging area of one worktree: text lines "<octal mode> <hex> <path>".
class Index {
public:
  explicit Index(const Repository &repo);

  // Parse the index file if it exists (no throw if missing)
  void load();

  // Overwrite the index file with current entries
  void save() const;

  // Hash `<worktree>/<relpath>` into a blob and add/replace its entry.
  // The mode is taken from the file: symlink, executable or regular.
  void add_path(std::string_view relpath);

  // Remove a path from index (no error if absent)
  void remove_path(std::string_view relpath);

  // add -A: make the index match the working tree. Paths already tracked stay
  // tracked even if an ignore rule matches them. Returns the entry count.
  auto stage_all() -> std::size_t;

  void assign(std::vector<IndexEntry> entries);

  const std::vector<IndexEntry> &entries() const { return entries_; }
  std::map<std::string, std::string> as_path_oid_map() const;

private:
  void sort_entries();

  const Repository *repo_;
  std::vector<IndexEntry> entries_;
};

} // namespace jobtree
