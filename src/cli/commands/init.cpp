#include "jobtree/config.hpp"
#include "jobtree/consts.hpp"
#include "jobtree/repo.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const jobtree::Repository repo{root};
    jobtree::Identity id{.name = "jobtree", .email = "jobtree@localhost"};
    if (const char *user = std::getenv("USER"); user != nullptr && *user != '\0') {
      id.name = user;
    }
    repo.init(id);
    std::cout << "Initialized empty jobtree repository in " << (root / jobtree::consts::kStoreDir)
              << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
