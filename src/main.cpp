#include "cli/registry.hpp"

#include "jobtree/errors.hpp"

#include <iostream>
#include <string_view>

namespace {

constexpr int kUsageExit = 2;
constexpr int kNoTreeExit = 128;

} // namespace

int main(int argc, char **argv) {
  jobtree::cli::register_all_commands();

  if (argc < 2) {
    jobtree::cli::print_usage();
    return kUsageExit;
  }
  const std::string_view name = argv[1];
  if (name == "-h" || name == "--help" || name == "help") {
    jobtree::cli::print_usage();
    return 0;
  }

  const auto fn = jobtree::cli::find_command(std::string(name));
  if (fn == nullptr) {
    std::cerr << "jobtree: '" << name << "' is not a jobtree command\n";
    jobtree::cli::print_usage();
    return kUsageExit;
  }

  // Commands report their own failures; a missing store can surface from
  // open_tree() before a command installs its handler.
  try {
    return fn(argc - 1, argv + 1);
  } catch (const jobtree::NotAVersionedTree &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return kNoTreeExit;
  }
}
