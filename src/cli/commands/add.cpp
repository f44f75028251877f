#include "cli/registry.hpp"

#include "jobtree/index.hpp"
#include "jobtree/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Stage one path given relative to the current directory.
static auto add_one(jobtree::Index &idx, const fs::path &root, const fs::path &arg) -> bool {
  const fs::path abs = fs::absolute(arg).lexically_normal();
  const auto rel = abs.lexically_relative(root).generic_string();
  if (rel.empty() || rel == "." || rel.starts_with("..")) {
    std::cerr << "add: outside the tree: " << arg << "\n";
    return false;
  }
  const auto st = fs::symlink_status(abs);
  if (!fs::exists(st)) {
    idx.remove_path(rel);
    std::cout << "removed: " << rel << "\n";
    return true;
  }
  if (!fs::is_regular_file(st) && !fs::is_symlink(st)) {
    std::cerr << "add: skipping non-regular file: " << rel << "\n";
    return false;
  }
  idx.add_path(rel);
  std::cout << "added: " << rel << "\n";
  return true;
}

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: jobtree add <path> [<path> ...] | jobtree add -A\n";
    return 2;
  }

  try {
    const fs::path root = jobtree::cli::open_tree();
    const jobtree::Repository repo{root};
    jobtree::Index idx{repo};
    idx.load();

    const std::string first = argv[1];
    if (first == "-A" || first == "--all") {
      const auto n = idx.stage_all();
      idx.save();
      std::cout << "staged " << n << " path(s)\n";
      return 0;
    }

    // Collect unique paths while preserving order
    std::vector<fs::path> paths;
    paths.reserve(static_cast<std::size_t>(argc) - 1);
    for (int i = 1; i < argc; ++i) {
      fs::path path = argv[i];
      if (std::ranges::find(paths, path) == paths.end()) {
        paths.push_back(std::move(path));
      }
    }

    bool any = false;
    for (const auto &path : paths) {
      any = add_one(idx, root, path) || any;
    }
    if (any) {
      idx.save();
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
