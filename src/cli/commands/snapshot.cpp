#include "cli/registry.hpp"

#include "jobtree/config.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"

#include <iostream>
#include <string>

int cmd_snapshot(int argc, char **argv) {
  std::string prefix;
  bool no_push = false;
  bool list = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--prefix" && i + 1 < argc) {
      prefix = argv[++i];
    } else if (a == "--no-push") {
      no_push = true;
    } else if (a == "--list") {
      list = true;
    } else {
      std::cerr << "usage: jobtree snapshot [--prefix P] [--no-push] | --list\n";
      return 2;
    }
  }

  try {
    const auto root = jobtree::cli::open_tree();
    const jobtree::Repository repo{root};
    const auto opts = jobtree::load_snapshot_options(repo.config_file());
    if (prefix.empty()) {
      prefix = opts.branch_prefix;
    }

    jobtree::SnapshotManager snapshots{root};
    if (list) {
      for (const auto &rec : snapshots.list_revisions(prefix)) {
        std::cout << rec.id << " " << rec.commit << "\n";
      }
      return 0;
    }
    const auto rec = snapshots.create_revision(prefix, opts.push_to_remote && !no_push);
    std::cout << rec.id << " " << rec.commit << (rec.published ? " (published)" : "") << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "snapshot: " << e.what() << "\n";
    return 1;
  }
}
