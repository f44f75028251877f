#include "jobtree/config.hpp"
#include "jobtree/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  // Make a unique temp repo root
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path repo_root = base / ("jobtree_init_test_" + suffix);

  try {
    fs::create_directories(repo_root);

    jobtree::Repository repo{repo_root};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }

    const jobtree::Identity id{.name = "Test User", .email = "test@example.com"};
    repo.init(id);

    // Check directory layout
    const fs::path store = repo_root / ".jobtree";
    for (const auto &dir : {store, store / "objects", store / "refs", store / "refs" / "heads",
                            store / "refs" / "tags", store / "worktrees"}) {
      if (!fs::is_directory(dir)) {
        std::cerr << dir << " missing\n";
        return 1;
      }
    }
    if (repo.is_linked() || repo.store_dir() != store || repo.common_dir() != store) {
      std::cerr << "main worktree layout mismatch\n";
      return 1;
    }

    // Check HEAD contents
    const std::string head_txt = slurp(store / "HEAD");
    if (head_txt != "ref: refs/heads/master\n") {
      std::cerr << "HEAD content mismatch: [" << head_txt << "]\n";
      return 1;
    }
    if (repo.head_ref() != "refs/heads/master" || repo.head_commit().has_value()) {
      std::cerr << "fresh repo should be on an unborn master\n";
      return 1;
    }

    // Check config contents + loader
    const auto loaded = jobtree::load_identity(repo.config_file());
    if (loaded.name != id.name || loaded.email != id.email) {
      std::cerr << "config load mismatch: got {" << loaded.name << "," << loaded.email << "}\n";
      return 1;
    }

    // Calling init again should throw
    bool threw = false;
    try {
      repo.init(id);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "init did not throw on already-initialized repo\n";
      return 1;
    }

    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(repo_root);
    return 1;
  }

  // Clean up
  std::error_code ec;
  fs::remove_all(repo_root, ec);
  return 0;
}
