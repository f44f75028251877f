#include "jobtree/ignore.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/util.hpp"

#include <fnmatch.h>
#include <sstream>

namespace jobtree {

namespace {

auto glob_match(const std::string &pattern, const std::string &text, int flags) -> bool {
  return ::fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

// "a/b/c" relative to base "a" -> "b/c"; false if not below base.
auto below_base(std::string_view path, std::string_view base, std::string_view &rest) -> bool {
  if (base.empty()) {
    rest = path;
    return true;
  }
  if (path.size() <= base.size() || !path.starts_with(base) || path[base.size()] != '/') {
    return false;
  }
  rest = path.substr(base.size() + 1);
  return true;
}

} // namespace

void IgnoreRules::add_pattern(std::string_view line, std::string_view base) {
  std::string p = strutil::trim(line);
  if (p.empty() || p[0] == '#') {
    return;
  }
  IgnoreRule rule{};
  rule.base = std::string(base);
  if (p[0] == '!') {
    rule.negated = true;
    p.erase(0, 1);
  } else if (p.starts_with("\\!") || p.starts_with("\\#")) {
    p.erase(0, 1);
  }
  if (!p.empty() && p.back() == '/') {
    rule.dir_only = true;
    while (!p.empty() && p.back() == '/') p.pop_back();
  }
  if (p.find('/') != std::string::npos) {
    rule.anchored = true;
    while (!p.empty() && p.front() == '/') p.erase(0, 1);
  }
  if (p.empty()) {
    return;
  }
  rule.pattern = std::move(p);
  rules_.push_back(std::move(rule));
}

void IgnoreRules::load_dir(const std::filesystem::path &root, std::string_view base) {
  const auto file = (base.empty() ? root : root / base) / consts::kIgnoreFile;
  if (!fs::exists(file)) {
    return;
  }
  std::istringstream iss(fs::read_text(file));
  std::string line;
  while (std::getline(iss, line)) {
    add_pattern(line, base);
  }
}

bool IgnoreRules::is_ignored(std::string_view rel_path, bool is_dir) const {
  bool ignored = false;
  const std::string_view name = rel_path.substr(rel_path.rfind('/') + 1);
  for (const auto &rule : rules_) {
    if (rule.dir_only && !is_dir) {
      continue;
    }
    std::string_view rest;
    if (!below_base(rel_path, rule.base, rest)) {
      continue;
    }
    const bool hit = rule.anchored ? glob_match(rule.pattern, std::string(rest), FNM_PATHNAME)
                                   : glob_match(rule.pattern, std::string(name), 0);
    if (hit) {
      ignored = !rule.negated;
    }
  }
  return ignored;
}

} // namespace jobtree
