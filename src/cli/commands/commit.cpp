#include "cli/registry.hpp"

#include "jobtree/repo.hpp"

#include <iostream>
#include <string>
#include <string_view>

// jobtree commit -m <message> [--allow-empty]
int cmd_commit(int argc, char **argv) {
  std::string message;
  bool allow_empty = false;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if ((arg == "-m" || arg == "--message") && i + 1 < argc) {
      message = argv[++i];
    } else if (arg == "--allow-empty") {
      allow_empty = true;
    } else {
      std::cerr << "commit: unexpected argument '" << arg << "'\n";
      return 2;
    }
  }
  if (message.empty()) {
    std::cerr << "usage: jobtree commit -m <message> [--allow-empty]\n";
    return 2;
  }

  try {
    const jobtree::Repository repo{jobtree::cli::open_tree()};
    const auto parent = repo.head_commit();
    if (parent && !allow_empty &&
        repo.read_commit(*parent).tree_hex == repo.write_tree_from_index()) {
      std::cout << "nothing to commit\n";
      return 1;
    }

    const std::string id = repo.commit_index(message + "\n");
    const std::string where = repo.head_ref().value_or("detached HEAD");
    const auto subject = message.substr(0, message.find('\n'));
    std::cout << "[" << where << " " << id.substr(0, 7) << "] " << subject << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
