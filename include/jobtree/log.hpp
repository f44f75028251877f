#pragma once
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace jobtree::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error };

// Threshold is read once from JOBTREE_LOG_LEVEL (default "info") and can be
// overridden by `log.level` in the store config or by set_level().
void set_level(Level level);
[[nodiscard]] auto level() -> Level;

[[nodiscard]] auto parse_level(std::string_view text) -> std::optional<Level>;
[[nodiscard]] auto level_name(Level level) -> std::string_view;

// Writes "jobtree[<tag>] <level>: <message>" to std::clog if enabled.
void write(Level level, std::string_view tag, std::string_view message);

// Tags used across the library; isolation infrastructure and task failures
// are kept apart so they can be told apart in job logs.
namespace tag {
inline constexpr std::string_view kSnapshot  = "snapshot";
inline constexpr std::string_view kIsolation = "isolation";
inline constexpr std::string_view kCleanup   = "cleanup";
inline constexpr std::string_view kTask      = "task";
inline constexpr std::string_view kLaunch    = "launch";
inline constexpr std::string_view kRemote    = "remote";
} // namespace tag

template <typename... Args>
void emit(Level lvl, std::string_view tag_name, const Args &...args) {
  if (lvl < level()) {
    return;
  }
  std::ostringstream os;
  (os << ... << args);
  write(lvl, tag_name, os.str());
}

template <typename... Args> void debug(std::string_view tag_name, const Args &...args) {
  emit(Level::Debug, tag_name, args...);
}
template <typename... Args> void info(std::string_view tag_name, const Args &...args) {
  emit(Level::Info, tag_name, args...);
}
template <typename... Args> void warn(std::string_view tag_name, const Args &...args) {
  emit(Level::Warn, tag_name, args...);
}
template <typename... Args> void error(std::string_view tag_name, const Args &...args) {
  emit(Level::Error, tag_name, args...);
}

} // namespace jobtree::log
