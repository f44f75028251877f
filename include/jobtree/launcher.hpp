#pragma once
#include "jobtree/backend.hpp"
#include "jobtree/config.hpp"
#include "jobtree/job.hpp"

#include <filesystem>
#include <vector>

namespace jobtree {

// Runs a batch of jobs from one working copy: one revision per launch, one
// isolated view per job, release after every job whatever its outcome.
class Launcher {
public:
  Launcher(SnapshotOptions options, ExecutionBackend &backend,
           std::filesystem::path start_dir = std::filesystem::current_path());

  // Throws NotAVersionedTree (isolation enabled, no tree above start_dir)
  // before any job is dispatched. Everything else ends up in the returns.
  auto launch(const std::vector<JobSpec> &jobs, const TaskFn &task) -> std::vector<JobReturn>;

  [[nodiscard]] const SnapshotOptions &options() const { return options_; }

private:
  SnapshotOptions options_;
  ExecutionBackend *backend_;
  std::filesystem::path start_dir_;
};

} // namespace jobtree
