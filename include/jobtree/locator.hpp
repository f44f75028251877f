#pragma once
#include <filesystem>

namespace jobtree {

// Walk from `start` towards "/" and return the first directory holding a
// `.jobtree` marker (store directory or linked-worktree file). Throws
// NotAVersionedTree when none is found. Nothing is cached.
auto locate_root(const std::filesystem::path &start) -> std::filesystem::path;

// locate_root(current_path())
auto locate_root() -> std::filesystem::path;

} // namespace jobtree
