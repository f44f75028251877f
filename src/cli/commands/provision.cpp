#include "cli/registry.hpp"

#include "jobtree/cleanup.hpp"
#include "jobtree/config.hpp"
#include "jobtree/isolation.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int cmd_provision(int argc, char **argv) {
  std::string revision;
  std::string job = "0";
  std::optional<fs::path> dir;
  std::vector<std::string> links;
  bool links_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--job" && i + 1 < argc) {
      job = argv[++i];
    } else if (a == "--dir" && i + 1 < argc) {
      dir = fs::absolute(argv[++i]);
    } else if (a == "--link" && i + 1 < argc) {
      links.emplace_back(argv[++i]);
      links_given = true;
    } else if (revision.empty() && !a.starts_with("-")) {
      revision = a;
    } else {
      revision.clear();
      break;
    }
  }
  if (revision.empty()) {
    std::cerr << "usage: jobtree provision <revision> [--job ID] [--dir D] [--link P]...\n";
    return 2;
  }

  try {
    const auto root = jobtree::cli::open_tree();
    const jobtree::Repository repo{root};
    const auto opts = jobtree::load_snapshot_options(repo.config_file());

    const auto rec = jobtree::SnapshotManager{root}.find_revision(revision);
    if (!rec) {
      std::cerr << "provision: unknown revision: " << revision << "\n";
      return 1;
    }
    const auto view = jobtree::IsolationProvisioner{root}.provision(
        *rec, job, dir ? dir : opts.worktree_dir, links_given ? links : opts.symlink_paths);
    std::cout << view.path.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "provision: " << e.what() << "\n";
    return 1;
  }
}

int cmd_release(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: jobtree release <view>\n";
    return 2;
  }
  try {
    jobtree::CleanupCoordinator cleanup{jobtree::cli::open_tree()};
    cleanup.release_path(fs::absolute(argv[1]));
    std::cout << "released " << argv[1] << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "release: " << e.what() << "\n";
    return 1;
  }
}
