#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

// One line of a .jobtreeignore file, scoped to the directory holding it.
struct IgnoreRule {
  std::string pattern; // fnmatch(3) glob, leading/trailing '/' stripped
  std::string base;    // repo-relative directory of the ignore file ("" = root)
  bool negated = false;
  bool dir_only = false;
  bool anchored = false; // pattern contains '/': match against the path below base
};

// Accumulates rules while a tree is walked top-down. Rules of a directory
// apply to its subtree only; later (deeper) rules override earlier ones.
class IgnoreRules {
public:
  // Parse one pattern line; blank lines and '#' comments are skipped.
  void add_pattern(std::string_view line, std::string_view base);

  // Load `<root>/<base>/.jobtreeignore` if present.
  void load_dir(const std::filesystem::path &root, std::string_view base);

  [[nodiscard]] bool is_ignored(std::string_view rel_path, bool is_dir) const;

  [[nodiscard]] auto rules() const -> const std::vector<IgnoreRule> & { return rules_; }

private:
  std::vector<IgnoreRule> rules_;
};

} // namespace jobtree
