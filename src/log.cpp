#include "jobtree/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace jobtree::log {

namespace {

auto initial_level() -> Level {
  if (const char *env = std::getenv("JOBTREE_LOG_LEVEL"); env != nullptr) {
    if (const auto lvl = parse_level(env)) {
      return *lvl;
    }
  }
  return Level::Info;
}

auto threshold() -> std::atomic<Level> & {
  static std::atomic<Level> lvl{initial_level()};
  return lvl;
}

auto sink_mutex() -> std::mutex & {
  static std::mutex m;
  return m;
}

} // namespace

void set_level(Level lvl) { threshold().store(lvl); }

auto level() -> Level { return threshold().load(); }

auto parse_level(std::string_view text) -> std::optional<Level> {
  std::string s(text);
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "debug") return Level::Debug;
  if (s == "info") return Level::Info;
  if (s == "warn" || s == "warning") return Level::Warn;
  if (s == "error") return Level::Error;
  return std::nullopt;
}

auto level_name(Level lvl) -> std::string_view {
  switch (lvl) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  }
  return "?";
}

void write(Level lvl, std::string_view tag_name, std::string_view message) {
  if (lvl < level()) {
    return;
  }
  // One line per call, even with several jobs logging from threads.
  const std::lock_guard lock{sink_mutex()};
  std::clog << "jobtree[" << tag_name << "] " << level_name(lvl) << ": " << message << '\n';
}

} // namespace jobtree::log
