#include "jobtree/config.hpp"

#include "jobtree/fs.hpp"
#include "jobtree/log.hpp"
#include "jobtree/util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

constexpr std::string_view kAuthorKey        = "author";
constexpr std::string_view kEmailKey         = "email";
constexpr std::string_view kLogLevelKey      = "log.level";
constexpr std::string_view kEnabledKey       = "snapshot.enabled";
constexpr std::string_view kBranchPrefixKey  = "snapshot.branch_prefix";
constexpr std::string_view kSymlinkPathsKey  = "snapshot.symlink_paths";
constexpr std::string_view kPushToRemoteKey  = "snapshot.push_to_remote";
constexpr std::string_view kWorktreeDirKey   = "snapshot.worktree_dir";
constexpr std::string_view kRemotePrefix     = "remote.";

// Splits "key: value"; returns false for blank, comment or malformed lines.
bool split_line(std::string_view line, std::string &key, std::string &value) {
  const std::string t = jobtree::strutil::trim(line);
  if (t.empty() || t[0] == '#')
    return false;
  const auto colon = t.find(':');
  if (colon == std::string::npos)
    return false;
  key = jobtree::strutil::trim(std::string_view(t).substr(0, colon));
  value = jobtree::strutil::trim(std::string_view(t).substr(colon + 1));
  return !key.empty();
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

namespace jobtree {

auto read_config(const std::filesystem::path &file) -> ConfigMap {
  ConfigMap out;
  if (!fs::exists(file))
    return out;

  std::istringstream iss(fs::read_text(file));
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(iss, line)) {
    if (split_line(line, key, value)) {
      out[key] = value; // last one wins
    }
  }
  return out;
}

void set_config_value(const std::filesystem::path &file, std::string_view key,
                      std::string_view value) {
  std::ostringstream os;
  bool replaced = false;
  if (fs::exists(file)) {
    std::istringstream iss(fs::read_text(file));
    std::string line;
    std::string k;
    std::string v;
    while (std::getline(iss, line)) {
      if (split_line(line, k, v) && k == key) {
        if (!replaced) {
          os << key << ": " << value << '\n';
          replaced = true;
        }
        continue;
      }
      os << line << '\n';
    }
  }
  if (!replaced) {
    os << key << ": " << value << '\n';
  }
  fs::write_text_atomic(file, os.str());
}

auto parse_bool(std::string_view key, std::string_view value) -> bool {
  const std::string v = lower(value);
  if (v == "true" || v == "yes" || v == "on" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "off" || v == "0")
    return false;
  throw std::invalid_argument("config: " + std::string(key) + ": expected a boolean, got '" +
                              std::string(value) + "'");
}

auto snapshot_options_from(const ConfigMap &cfg) -> SnapshotOptions {
  SnapshotOptions opts{};
  if (const auto it = cfg.find(kEnabledKey); it != cfg.end())
    opts.enabled = parse_bool(kEnabledKey, it->second);
  if (const auto it = cfg.find(kBranchPrefixKey); it != cfg.end() && !it->second.empty())
    opts.branch_prefix = it->second;
  if (const auto it = cfg.find(kSymlinkPathsKey); it != cfg.end())
    opts.symlink_paths = strutil::split_list(it->second, ',');
  if (const auto it = cfg.find(kPushToRemoteKey); it != cfg.end())
    opts.push_to_remote = parse_bool(kPushToRemoteKey, it->second);
  if (const auto it = cfg.find(kWorktreeDirKey); it != cfg.end() && !it->second.empty()) {
    const std::filesystem::path dir{it->second};
    if (!dir.is_absolute()) {
      throw std::invalid_argument("config: " + std::string(kWorktreeDirKey) +
                                  " must be an absolute path: " + it->second);
    }
    opts.worktree_dir = dir;
  }
  return opts;
}

auto load_snapshot_options(const std::filesystem::path &file) -> SnapshotOptions {
  return snapshot_options_from(read_config(file));
}

auto remote_location(const ConfigMap &cfg, std::string_view name)
    -> std::optional<std::filesystem::path> {
  const std::string key = std::string(kRemotePrefix) + std::string(name);
  if (const auto it = cfg.find(key); it != cfg.end() && !it->second.empty()) {
    return std::filesystem::path{it->second};
  }
  return std::nullopt;
}

Identity load_identity(const std::filesystem::path &config_file) {
  const auto cfg = read_config(config_file);
  Identity out{};
  if (const auto it = cfg.find(kAuthorKey); it != cfg.end())
    out.name = it->second;
  if (const auto it = cfg.find(kEmailKey); it != cfg.end())
    out.email = it->second;
  return out;
}

void save_identity(const std::filesystem::path &config_file, const Identity &id) {
  set_config_value(config_file, kAuthorKey, id.name);
  set_config_value(config_file, kEmailKey, id.email);
}

void apply_log_level(const ConfigMap &cfg) {
  if (const auto it = cfg.find(kLogLevelKey); it != cfg.end()) {
    if (const auto lvl = log::parse_level(it->second)) {
      log::set_level(*lvl);
    } else {
      log::warn("config", "ignoring unknown log.level '", it->second, "'");
    }
  }
}

} // namespace jobtree
