#include "cli/registry.hpp"

#include "jobtree/backend.hpp"
#include "jobtree/config.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/launcher.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/util.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <vector>

namespace {

// Runs the command from the job's working root with the job's identity in
// the environment.
auto shell_task(const std::string &command) -> jobtree::TaskFn {
  return [command](const jobtree::JobContext &ctx) -> int {
    using jobtree::strutil::shell_quote;
    std::string line = "cd " + shell_quote(ctx.working_root.string()) + " && " +
                       "JOBTREE_JOB_NUM=" + std::to_string(ctx.job_num) +
                       " JOBTREE_JOB_ID=" + shell_quote(ctx.job_id) +
                       " JOBTREE_WORKING_ROOT=" + shell_quote(ctx.working_root.string()) +
                       " JOBTREE_ORIGIN_ROOT=" + shell_quote(ctx.origin_root.string()) +
                       " JOBTREE_REVISION=" + shell_quote(ctx.revision) +
                       " JOBTREE_ISOLATION=" + std::string(jobtree::mode_name(ctx.mode)) +
                       " /bin/sh -c " + shell_quote(command);
    const int status = std::system(line.c_str());
    if (status == -1) {
      throw std::runtime_error("cannot start /bin/sh");
    }
    if (WIFSIGNALED(status)) {
      throw std::runtime_error("killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return WEXITSTATUS(status);
  };
}

} // namespace

int cmd_launch(int argc, char **argv) {
  int count = 1;
  bool threads = false;
  std::optional<bool> isolate;
  std::string command;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-n" && i + 1 < argc) {
      count = std::atoi(argv[++i]);
    } else if (a == "--threads") {
      threads = true;
    } else if (a == "--isolate") {
      isolate = true;
    } else if (a == "--no-isolate") {
      isolate = false;
    } else if (a == "--") {
      for (++i; i < argc; ++i) {
        if (!command.empty()) {
          command.push_back(' ');
        }
        command += argv[i];
      }
    } else {
      command.clear();
      break;
    }
  }
  if (command.empty() || count < 1) {
    std::cerr << "usage: jobtree launch [-n N] [--threads] [--isolate|--no-isolate] -- "
                 "<command>\n";
    return 2;
  }

  try {
    jobtree::SnapshotOptions opts;
    try {
      const jobtree::Repository repo{jobtree::cli::open_tree()};
      opts = jobtree::load_snapshot_options(repo.config_file());
    } catch (const jobtree::NotAVersionedTree &) {
      // no tree: defaults, isolation off unless asked for
    }
    if (isolate) {
      opts.enabled = *isolate;
    }

    std::vector<jobtree::JobSpec> jobs;
    for (int i = 0; i < count; ++i) {
      jobs.push_back(jobtree::JobSpec{.num = i, .id = std::to_string(i), .args = {}});
    }

    std::unique_ptr<jobtree::ExecutionBackend> backend;
    if (threads) {
      backend = std::make_unique<jobtree::ThreadBackend>();
    } else {
      backend = std::make_unique<jobtree::LocalProcessBackend>();
    }

    jobtree::Launcher launcher{opts, *backend};
    const auto results = launcher.launch(jobs, shell_task(command));

    int rc = 0;
    for (const auto &r : results) {
      std::cout << "job " << r.num << " " << jobtree::status_name(r.status) << " "
                << jobtree::mode_name(r.mode) << " rc=" << r.return_value;
      if (!r.revision.empty()) {
        std::cout << " revision=" << r.revision;
      }
      if (!r.error.empty()) {
        std::cout << " error=" << r.error;
      }
      std::cout << "\n";
      if (r.status != jobtree::JobStatus::Completed || r.return_value != 0) {
        rc = 1;
      }
    }
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "launch: " << e.what() << "\n";
    return 1;
  }
}
