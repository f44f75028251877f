#include "cli/registry.hpp"

#include "jobtree/config.hpp"
#include "jobtree/repo.hpp"

#include <iostream>
#include <string>
#include <string_view>

int cmd_config(int argc, char **argv) {
  const std::string sub = argc >= 2 ? argv[1] : "";
  if (!((sub == "get" && argc == 3) || (sub == "set" && argc == 4) ||
        (sub == "list" && argc == 2))) {
    std::cerr << "usage: jobtree config get <key> | set <key> <value> | list\n";
    return 2;
  }
  try {
    const jobtree::Repository repo{jobtree::cli::open_tree()};
    auto cfg = jobtree::read_config(repo.config_file());

    if (sub == "list") {
      for (const auto &[k, v] : cfg) {
        std::cout << k << ": " << v << "\n";
      }
      return 0;
    }
    if (sub == "get") {
      const auto it = cfg.find(std::string_view(argv[2]));
      if (it == cfg.end()) {
        return 1;
      }
      std::cout << it->second << "\n";
      return 0;
    }

    // Reject values the snapshot options would not parse.
    cfg[argv[2]] = argv[3];
    (void)jobtree::snapshot_options_from(cfg);
    jobtree::set_config_value(repo.config_file(), argv[2], argv[3]);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
