#pragma once
#include "jobtree/consts.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

struct Identity {
  std::string name;
  std::string email;
};

// Options of the snapshot/isolation subsystem, normally supplied by the
// launcher's configuration layer.
struct SnapshotOptions {
  bool enabled = false;
  std::string branch_prefix{consts::kDefaultBranchPrefix};
  std::vector<std::string> symlink_paths{"outputs", "multirun", ".submitit"};
  bool push_to_remote = true;
  std::optional<std::filesystem::path> worktree_dir; // unset: parent of the tree
};

// Line-oriented "key: value" file; '#' starts a comment line.
using ConfigMap = std::map<std::string, std::string, std::less<>>;

auto read_config(const std::filesystem::path &file) -> ConfigMap;

// Set (or add) one key, keeping every other line of the file as is.
void set_config_value(const std::filesystem::path &file, std::string_view key,
                      std::string_view value);

// true/false/yes/no/on/off/1/0; throws std::invalid_argument otherwise.
auto parse_bool(std::string_view key, std::string_view value) -> bool;

auto snapshot_options_from(const ConfigMap &cfg) -> SnapshotOptions;
auto load_snapshot_options(const std::filesystem::path &file) -> SnapshotOptions;

// "remote.<name>" entry, if configured
auto remote_location(const ConfigMap &cfg, std::string_view name = consts::kDefaultRemote)
    -> std::optional<std::filesystem::path>;

// Identity stored as "author:" / "email:" keys (empty fields if missing)
Identity load_identity(const std::filesystem::path &config_file);
void save_identity(const std::filesystem::path &config_file, const Identity &id);

// Applies "log.level" if present and valid.
void apply_log_level(const ConfigMap &cfg);

} // namespace jobtree
