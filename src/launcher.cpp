#include "jobtree/launcher.hpp"

#include "jobtree/cleanup.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/isolation.hpp"
#include "jobtree/locator.hpp"
#include "jobtree/log.hpp"
#include "jobtree/snapshot.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace stdfs = std::filesystem;

namespace jobtree {

namespace {

constexpr std::string_view kForeignException = "task threw a non-standard exception";

// Run the task where the process stands and fold its outcome into `ret`;
// task errors never escape.
void run_task(JobReturn &ret, const TaskFn &task, const JobContext &ctx) {
  try {
    ret.return_value = run_identity(task, ctx);
    ret.status = JobStatus::Completed;
  } catch (const std::exception &e) {
    ret.status = JobStatus::Failed;
    ret.error = e.what();
    log::error(log::tag::kTask, "job ", ctx.job_num, " failed: ", e.what());
  } catch (...) {
    ret.status = JobStatus::Failed;
    ret.error = kForeignException;
    log::error(log::tag::kTask, "job ", ctx.job_num, " failed: ", kForeignException);
  }
}

// Releases the job's view when the unit's scope ends, whichever way it ends.
class ViewRelease {
public:
  ViewRelease(stdfs::path root, const std::optional<IsolatedView> &view)
      : root_(std::move(root)), view_(view) {}
  ViewRelease(const ViewRelease &) = delete;
  auto operator=(const ViewRelease &) -> ViewRelease & = delete;

  ~ViewRelease() {
    if (!view_) {
      return;
    }
    try {
      CleanupCoordinator{root_}.release(*view_);
    } catch (const std::exception &e) {
      log::warn(log::tag::kCleanup, e.what());
    }
  }

private:
  stdfs::path root_;
  const std::optional<IsolatedView> &view_;
};

// A job process that died without a result never ran its release. Its view
// is found again by registry name: "<revision>-job<id>-<suffix>".
void reclaim_views(const stdfs::path &root, const RevisionRecord &revision, const JobSpec &job,
                   JobReturn &ret) {
  const std::string prefix = revision.id + "-job" + job.id + "-";
  CleanupCoordinator cleanup{root};
  try {
    for (const auto &rec : cleanup.list()) {
      if (!rec.name.starts_with(prefix) ||
          rec.name.find('-', prefix.size()) != std::string::npos) {
        continue;
      }
      ret.view = rec.path;
      cleanup.release_path(rec.path);
      log::warn(log::tag::kCleanup, "released view ", rec.path.string(), " left by job ",
                job.num);
    }
  } catch (const std::exception &e) {
    log::warn(log::tag::kCleanup, "job ", job.num, ": ", e.what());
  }
}

} // namespace

Launcher::Launcher(SnapshotOptions options, ExecutionBackend &backend, stdfs::path start_dir)
    : options_(std::move(options)), backend_(&backend), start_dir_(std::move(start_dir)) {}

auto Launcher::launch(const std::vector<JobSpec> &jobs, const TaskFn &task)
    -> std::vector<JobReturn> {
  std::vector<JobUnit> units;
  units.reserve(jobs.size());

  stdfs::path root;
  // One revision for the whole batch.
  std::optional<RevisionRecord> revision;

  if (!options_.enabled) {
    root = stdfs::absolute(start_dir_);
    for (const auto &job : jobs) {
      units.emplace_back([job, root, task]() {
        JobReturn ret{};
        ret.num = job.num;
        ret.mode = IsolationMode::Disabled;
        const JobContext ctx{.job_num = job.num,
                             .job_id = job.id,
                             .args = job.args,
                             .working_root = root,
                             .origin_root = root,
                             .mode = IsolationMode::Disabled,
                             .revision = {}};
        run_task(ret, task, ctx);
        return ret;
      });
    }
  } else {
    root = locate_root(start_dir_);

    try {
      revision = SnapshotManager{root}.create_revision(options_.branch_prefix,
                                                       options_.push_to_remote);
    } catch (const SnapshotCreationFailure &e) {
      log::error(log::tag::kSnapshot, e.what());
      log::warn(log::tag::kLaunch, "running all ", jobs.size(), " job(s) against the live tree");
    }

    const bool may_switch = !backend_->shares_process();
    const auto options = options_;
    for (const auto &job : jobs) {
      units.emplace_back([job, root, task, revision, options, may_switch]() {
        JobReturn ret{};
        ret.num = job.num;
        JobContext ctx{.job_num = job.num,
                       .job_id = job.id,
                       .args = job.args,
                       .working_root = root,
                       .origin_root = root,
                       .mode = IsolationMode::Fallback,
                       .revision = {}};

        std::optional<IsolatedView> view;
        const ViewRelease release{root, view};
        if (revision) {
          ctx.revision = revision->id;
          ret.revision = revision->id;
          try {
            view = IsolationProvisioner{root}.provision(*revision, job.id, options.worktree_dir,
                                                        options.symlink_paths);
            ctx.mode = IsolationMode::Isolated;
            ctx.working_root = view->path;
            ret.view = view->path;
          } catch (const IsolationFailure &e) {
            log::error(log::tag::kIsolation, e.what());
            log::warn(log::tag::kIsolation, "job ", job.num, " falls back to the live tree ",
                      root.string());
          }
        }

        // Declared after `release` so the directory is restored before the
        // view goes away.
        std::optional<ExecutionContextGuard> cwd;
        if (view && may_switch) {
          try {
            cwd.emplace(view->path);
          } catch (const IsolationFailure &e) {
            log::error(log::tag::kIsolation, "job ", job.num, ": ", e.what());
            log::warn(log::tag::kIsolation, "job ", job.num, " falls back to the live tree ",
                      root.string());
            ctx.mode = IsolationMode::Fallback;
            ctx.working_root = root;
            ret.view.clear();
          }
        }
        ret.mode = ctx.mode;

        run_task(ret, task, ctx);
        return ret;
      });
    }
  }

  std::vector<std::unique_ptr<JobHandle>> handles;
  handles.reserve(units.size());
  for (auto &unit : units) {
    handles.push_back(backend_->dispatch(std::move(unit)));
  }

  std::vector<JobReturn> results;
  results.reserve(handles.size());
  for (std::size_t i = 0; i < handles.size(); ++i) {
    auto ret = handles[i]->wait();
    if (ret.num < 0) {
      // Nothing came back from the unit; report it the way the launch ran it.
      ret.num = jobs[i].num;
      if (!options_.enabled) {
        ret.mode = IsolationMode::Disabled;
      } else if (revision) {
        ret.mode = IsolationMode::Isolated;
        ret.revision = revision->id;
        reclaim_views(root, *revision, jobs[i], ret);
      } else {
        ret.mode = IsolationMode::Fallback;
      }
    }
    if (ret.status == JobStatus::Failed) {
      log::warn(log::tag::kLaunch, "job ", ret.num, " ", status_name(ret.status), " (",
                mode_name(ret.mode), "): ", ret.error);
    } else {
      log::info(log::tag::kLaunch, "job ", ret.num, " ", status_name(ret.status), " (",
                mode_name(ret.mode), ") returned ", ret.return_value);
    }
    results.push_back(std::move(ret));
  }
  return results;
}

} // namespace jobtree
