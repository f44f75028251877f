#pragma once
#include "cli/command.hpp"

#include <filesystem>
#include <string>

namespace jobtree::cli {

void register_command(const std::string &name, command_fn fn, const std::string &help);
command_fn find_command(const std::string &name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

// Root of the tree around the current directory, with `log.level` from its
// config applied. Throws NotAVersionedTree.
auto open_tree() -> std::filesystem::path;

} // namespace jobtree::cli
