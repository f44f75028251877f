#pragma once
#include "jobtree/isolation.hpp"
#include "jobtree/registry.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace jobtree {

// Tears down isolated views. Never touches link targets, the originating
// tree or revision branches.
class CleanupCoordinator {
public:
  explicit CleanupCoordinator(std::filesystem::path tree_root);

  // Unlink redirects, remove the container, deregister the checkout. Every
  // step is attempted; the collected failures are thrown as CleanupFailure.
  void release(const IsolatedView &view);

  // Release a leftover view known only by its path (operator use).
  void release_path(const std::filesystem::path &view_path);

  [[nodiscard]] auto list() const -> std::vector<WorktreeRecord>;

  // Deregister entries whose working path is gone; returns their names.
  auto prune() -> std::vector<std::string>;

private:
  std::filesystem::path tree_root_;
};

} // namespace jobtree
