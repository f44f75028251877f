#include "cli/registry.hpp"

#include "jobtree/cleanup.hpp"

#include <iostream>
#include <string>

int cmd_worktree(int argc, char **argv) {
  const std::string sub = argc >= 2 ? argv[1] : "list";
  if (sub != "list" && sub != "prune") {
    std::cerr << "usage: jobtree worktree list|prune\n";
    return 2;
  }
  try {
    jobtree::CleanupCoordinator cleanup{jobtree::cli::open_tree()};
    if (sub == "prune") {
      for (const auto &name : cleanup.prune()) {
        std::cout << "pruned " << name << "\n";
      }
      return 0;
    }
    for (const auto &rec : cleanup.list()) {
      std::cout << rec.name << "  " << rec.path.string() << "  " << rec.head
                << (rec.prunable ? "  (prunable)" : "") << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "worktree: " << e.what() << "\n";
    return 1;
  }
}
