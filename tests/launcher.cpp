#include "jobtree/backend.hpp"
#include "jobtree/context.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/index.hpp"
#include "jobtree/launcher.hpp"
#include "jobtree/registry.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <random>
#include <set>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static int fail(const fs::path &base, const std::string &msg) {
  std::cerr << msg << "\n";
  std::error_code ec;
  fs::remove_all(base, ec);
  return 1;
}

static auto make_jobs(int n) -> std::vector<jobtree::JobSpec> {
  std::vector<jobtree::JobSpec> jobs;
  for (int i = 0; i < n; ++i) {
    jobs.push_back(jobtree::JobSpec{.num = i, .id = std::to_string(i), .args = {}});
  }
  return jobs;
}

// Checks the captured state and drops a marker in the shared outputs dir.
static int check_and_mark(const jobtree::JobContext &ctx) {
  if (jobtree::fs::read_text(ctx.working_root / "app.py") != "print(2)\n" ||
      jobtree::fs::read_text(ctx.working_root / "notes.txt") != "remember\n") {
    throw std::runtime_error("unexpected code in " + ctx.working_root.string());
  }
  write_file(ctx.working_root / "outputs" / ("job" + ctx.job_id + ".txt"), ctx.job_id);
  return ctx.job_num * 10;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("jobtree_launch_" + std::to_string(std::random_device{}()));
  const fs::path root = base / "tree";
  const fs::path views = base / "views";
  fs::create_directories(root);
  fs::create_directories(views);

  try {
    const jobtree::Repository repo{root};
    repo.init();
    write_file(root / "app.py", "print(1)\n");
    jobtree::Index idx{repo};
    idx.load();
    idx.add_path("app.py");
    idx.save();
    (void)repo.commit_index("init\n");
    write_file(root / "app.py", "print(2)\n");
    write_file(root / "notes.txt", "remember\n");

    jobtree::SnapshotOptions opts{};
    opts.enabled = true;
    opts.branch_prefix = "batch";
    opts.symlink_paths = {"outputs"};
    opts.push_to_remote = false;
    opts.worktree_dir = views;

    jobtree::SnapshotManager snapshots{root};

    // Threads: one revision, three views, shared outputs
    {
      jobtree::ThreadBackend threads;
      jobtree::Launcher launcher{opts, threads, root};
      const auto results = launcher.launch(make_jobs(3), check_and_mark);
      std::set<std::string> revisions;
      std::set<fs::path> view_paths;
      for (const auto &r : results) {
        if (r.status != jobtree::JobStatus::Completed || r.mode != jobtree::IsolationMode::Isolated ||
            r.return_value != r.num * 10) {
          return fail(base, "thread job " + std::to_string(r.num) + " failed: " + r.error);
        }
        revisions.insert(r.revision);
        view_paths.insert(r.view);
      }
      if (revisions.size() != 1 || view_paths.size() != 3 ||
          snapshots.list_revisions("batch").size() != 1) {
        return fail(base, "expected one revision and three distinct views");
      }
      for (int i = 0; i < 3; ++i) {
        if (!fs::exists(root / "outputs" / ("job" + std::to_string(i) + ".txt"))) {
          return fail(base, "job output missing from the shared outputs dir");
        }
      }
      if (fs::directory_iterator(views) != fs::directory_iterator{} ||
          !jobtree::WorktreeRegistry{repo}.list().empty()) {
        return fail(base, "views left behind after launch");
      }
    }

    // Processes: the working directory is switched inside each job
    {
      jobtree::LocalProcessBackend procs;
      jobtree::Launcher launcher{opts, procs, root};
      const auto results = launcher.launch(make_jobs(2), [](const jobtree::JobContext &ctx) {
        if (!fs::equivalent(fs::current_path(), ctx.working_root)) {
          throw std::runtime_error("cwd is not the view");
        }
        return check_and_mark(ctx);
      });
      for (const auto &r : results) {
        if (r.status != jobtree::JobStatus::Completed || r.mode != jobtree::IsolationMode::Isolated ||
            r.return_value != r.num * 10 || r.revision.empty()) {
          return fail(base, "process job " + std::to_string(r.num) + " failed: " + r.error);
        }
      }
      if (snapshots.list_revisions("batch").size() != 2) {
        return fail(base, "each launch should capture exactly one revision");
      }
    }

    // Task failure is reported per job; isolation is still released
    {
      jobtree::LocalProcessBackend procs;
      jobtree::Launcher launcher{opts, procs, root};
      const auto results = launcher.launch(make_jobs(3), [](const jobtree::JobContext &ctx) {
        if (ctx.job_num == 1) {
          throw std::runtime_error("task blew up\non two lines");
        }
        return 0;
      });
      if (results.size() != 3 || results[1].status != jobtree::JobStatus::Failed ||
          results[1].error != "task blew up\non two lines" ||
          results[1].mode != jobtree::IsolationMode::Isolated ||
          results[0].status != jobtree::JobStatus::Completed ||
          results[2].status != jobtree::JobStatus::Completed) {
        return fail(base, "task failure not reported per job");
      }
      if (fs::directory_iterator(views) != fs::directory_iterator{}) {
        return fail(base, "failed job's view not released");
      }
    }

    // Unusable worktree_dir: every job falls back to the live tree
    {
      auto bad = opts;
      bad.worktree_dir = base / "missing" / "dir";
      jobtree::ThreadBackend threads;
      jobtree::Launcher launcher{bad, threads, root};
      const auto results = launcher.launch(make_jobs(2), [&](const jobtree::JobContext &ctx) {
        return ctx.working_root == root ? 0 : 1;
      });
      for (const auto &r : results) {
        if (r.mode != jobtree::IsolationMode::Fallback ||
            r.status != jobtree::JobStatus::Completed || r.return_value != 0) {
          return fail(base, "job did not fall back to the live tree");
        }
      }
    }

    // A task throwing something that is not a std::exception still fails
    // alone, and its view is still released
    {
      jobtree::LocalProcessBackend procs;
      jobtree::ThreadBackend threads;
      for (jobtree::ExecutionBackend *backend :
           std::initializer_list<jobtree::ExecutionBackend *>{&procs, &threads}) {
        jobtree::Launcher launcher{opts, *backend, root};
        const auto results = launcher.launch(make_jobs(2), [](const jobtree::JobContext &ctx) {
          if (ctx.job_num == 0) {
            throw 42;
          }
          return 7;
        });
        if (results.size() != 2 || results[0].status != jobtree::JobStatus::Failed ||
            results[0].error.empty() || results[0].mode != jobtree::IsolationMode::Isolated ||
            results[1].status != jobtree::JobStatus::Completed || results[1].return_value != 7) {
          return fail(base, std::string(backend->name()) + ": foreign exception not folded");
        }
        if (fs::directory_iterator(views) != fs::directory_iterator{} ||
            !jobtree::WorktreeRegistry{repo}.list().empty()) {
          return fail(base, std::string(backend->name()) + ": view leaked after a foreign throw");
        }
      }
    }

    // A job process that exits without a result: reported as the launch ran
    // it, and the view it left behind is released by the launcher
    {
      jobtree::LocalProcessBackend procs;
      jobtree::Launcher launcher{opts, procs, root};
      const auto results = launcher.launch(make_jobs(1), [](const jobtree::JobContext &) -> int {
        ::_exit(3);
      });
      const auto &r = results.at(0);
      if (r.status != jobtree::JobStatus::Failed || r.num != 0 ||
          r.mode != jobtree::IsolationMode::Isolated || r.revision.empty() || r.view.empty() ||
          r.error.find("exited with status 3") == std::string::npos) {
        return fail(base, "dead job process misreported: " + r.error);
      }
      if (fs::directory_iterator(views) != fs::directory_iterator{} ||
          !jobtree::WorktreeRegistry{repo}.list().empty()) {
        return fail(base, "view of a dead job process not reclaimed");
      }
    }

    // The view cannot become the working directory: isolation falls back,
    // the task itself still succeeds
    {
      jobtree::LocalProcessBackend procs;
      jobtree::Launcher launcher{opts, procs, root};
      std::vector<jobtree::JobReturn> results;
      {
        // Every forked job inherits this switch and must refuse its own.
        const jobtree::ExecutionContextGuard held{base};
        results = launcher.launch(make_jobs(2), [&](const jobtree::JobContext &ctx) {
          return ctx.working_root == root && ctx.mode == jobtree::IsolationMode::Fallback ? 5 : 1;
        });
      }
      for (const auto &r : results) {
        if (r.status != jobtree::JobStatus::Completed || r.return_value != 5 ||
            r.mode != jobtree::IsolationMode::Fallback || !r.view.empty()) {
          return fail(base, "refused switch not reported as a fallback: " + r.error);
        }
      }
      if (fs::directory_iterator(views) != fs::directory_iterator{} ||
          !jobtree::WorktreeRegistry{repo}.list().empty()) {
        return fail(base, "view left behind after a refused switch");
      }
    }

    // Disabled: no revision, live tree
    {
      const auto before = snapshots.list_revisions().size();
      auto off = opts;
      off.enabled = false;
      jobtree::ThreadBackend threads;
      jobtree::Launcher launcher{off, threads, root};
      const auto results = launcher.launch(make_jobs(2), [&](const jobtree::JobContext &ctx) {
        return ctx.working_root == root && ctx.revision.empty() ? 0 : 1;
      });
      for (const auto &r : results) {
        if (r.mode != jobtree::IsolationMode::Disabled || r.return_value != 0 ||
            !r.revision.empty()) {
          return fail(base, "disabled launch touched isolation");
        }
      }
      if (snapshots.list_revisions().size() != before) {
        return fail(base, "disabled launch captured a revision");
      }
    }

    // Not a versioned tree: nothing is dispatched
    {
      const fs::path outside = base / "outside";
      fs::create_directories(outside);
      std::atomic<int> calls{0};
      jobtree::ThreadBackend threads;
      jobtree::Launcher launcher{opts, threads, outside};
      bool threw = false;
      try {
        (void)launcher.launch(make_jobs(2), [&](const jobtree::JobContext &) {
          ++calls;
          return 0;
        });
      } catch (const jobtree::NotAVersionedTree &) {
        threw = true;
      }
      if (!threw || calls.load() != 0) {
        return fail(base, "expected NotAVersionedTree before any job ran");
      }
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    return fail(base, std::string("exception: ") + e.what());
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
