#pragma once
#include "jobtree/config.hpp"
#include "jobtree/consts.hpp"
#include "jobtree/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

struct TreeEntry {
  std::uint32_t mode; // consts::kModeFile, kModeExec, kModeSymlink or kModeTree
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

// A working tree plus the store behind it. The main worktree keeps its store
// in `<root>/.jobtree/`; a linked worktree has a `.jobtree` file pointing at
// its admin dir `<main>/.jobtree/worktrees/<name>/`, which holds its own HEAD
// and index while objects, refs and config stay shared.
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  // Per-worktree admin dir (HEAD, index)
  [[nodiscard]] const std::filesystem::path &store_dir() const { return store_dir_; }
  // Shared store (objects, refs, config, worktrees)
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }
  [[nodiscard]] bool is_linked() const { return linked_; }

  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto worktrees_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kWorktreesDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return store_dir_ / consts::kHeadFile;
  }
  [[nodiscard]] auto index_file() const -> std::filesystem::path {
    return store_dir_ / consts::kIndexFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return common_dir_ / consts::kConfigFile;
  }

  // Create the store under root(). Fails if one already exists.
  void init(const Identity &identity = Identity{.name = "jobtree",
                                                .email = "jobtree@localhost"}) const;

  [[nodiscard]] auto is_initialized() const -> bool;

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Is `ancestor_hex` reachable from `descendant_hex` (equality included)?
  [[nodiscard]] auto is_commit_ancestor(std::string_view ancestor_hex,
                                        std::string_view descendant_hex) const -> bool;

  // HEAD helpers: the branch ref HEAD points at ("refs/heads/x"), and the
  // commit it resolves to. Both nullopt on a detached/unborn HEAD respectively.
  [[nodiscard]] auto head_ref() const -> std::optional<std::string>;
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;

  // 40-hex id or branch name -> commit id
  [[nodiscard]] auto resolve(std::string_view rev) const -> std::optional<std::string>;

  [[nodiscard]] auto write_tree_from_index() const -> std::string;

  // Commit the index on top of HEAD and advance the current branch (or the
  // detached HEAD). Returns the new commit id.
  [[nodiscard]] auto commit_index(std::string_view message) const -> std::string;


private:
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  std::filesystem::path store_dir_;
  std::filesystem::path common_dir_;
  bool linked_ = false;
};

} // namespace jobtree
