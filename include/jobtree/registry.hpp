#pragma once
#include "jobtree/repo.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

// Exclusive hold on the checkout registry of one store: a process-local mutex
// (threads) plus flock(2) on `.jobtree/worktrees.lock` (processes). Registry
// mutations take a `const RegistryLock &` to prove the lock is held.
class RegistryLock {
public:
  explicit RegistryLock(const Repository &repo);
  ~RegistryLock();

  RegistryLock(const RegistryLock &) = delete;
  auto operator=(const RegistryLock &) -> RegistryLock & = delete;
  RegistryLock(RegistryLock &&) = delete;
  auto operator=(RegistryLock &&) -> RegistryLock & = delete;

private:
  std::unique_lock<std::mutex> guard_;
  int fd_{-1};
};

struct WorktreeRecord {
  std::string name;           // registry name (admin dir under .jobtree/worktrees/)
  std::filesystem::path path; // working path of the linked worktree
  std::string head;           // "ref: refs/heads/x" or a 40-hex id
  bool prunable = false;      // working path is gone
};

// Linked worktrees registered in a store's `worktrees/` directory.
class WorktreeRegistry {
public:
  explicit WorktreeRegistry(const Repository &repo);

  [[nodiscard]] auto lock() const -> RegistryLock { return RegistryLock{*repo_}; }

  [[nodiscard]] bool contains(std::string_view name) const;

  // Create the admin dir, the working directory `path` and its link file.
  // `head_line` is written as the worktree's HEAD. Throws std::runtime_error
  // if the name is taken or invalid.
  auto add(const RegistryLock &held, const std::string &name, const std::filesystem::path &path,
           std::string_view head_line) const -> Repository;

  // Drop the admin dir of `name`; false if there was none.
  bool remove(const RegistryLock &held, const std::string &name) const;

  [[nodiscard]] auto list() const -> std::vector<WorktreeRecord>;
  [[nodiscard]] auto find_by_path(const std::filesystem::path &path) const
      -> std::optional<WorktreeRecord>;

  // Deregister every entry whose working path no longer exists.
  auto prune(const RegistryLock &held) const -> std::vector<std::string>;

private:
  [[nodiscard]] auto admin_dir(std::string_view name) const -> std::filesystem::path;

  const Repository *repo_;
};

} // namespace jobtree
