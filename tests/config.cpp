#include "jobtree/config.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/log.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

static int fail(const fs::path &dir, const std::string &msg) {
  std::cerr << msg << "\n";
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 1;
}

int main() {
  const fs::path dir =
      fs::temp_directory_path() / ("jobtree_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir);
  const fs::path file = dir / "config";

  try {
    // Defaults
    const auto defaults = jobtree::load_snapshot_options(file);
    if (defaults.enabled || defaults.branch_prefix != "slurm-job" || !defaults.push_to_remote ||
        defaults.worktree_dir.has_value() ||
        defaults.symlink_paths != std::vector<std::string>{"outputs", "multirun", ".submitit"}) {
      return fail(dir, "unexpected defaults");
    }

    jobtree::fs::write_text_atomic(file, "# jobtree settings\n"
                                         "author: A\n"
                                         "snapshot.enabled: yes\n"
                                         "snapshot.branch_prefix: exp\n"
                                         "snapshot.symlink_paths: out, logs ,\n"
                                         "snapshot.push_to_remote: Off\n"
                                         "snapshot.worktree_dir: /scratch/views\n"
                                         "remote.origin: /srv/mirror\n"
                                         "some.unknown: kept\n");
    const auto opts = jobtree::load_snapshot_options(file);
    if (!opts.enabled || opts.branch_prefix != "exp" || opts.push_to_remote ||
        opts.symlink_paths != std::vector<std::string>{"out", "logs"} ||
        opts.worktree_dir != fs::path("/scratch/views")) {
      return fail(dir, "options not parsed");
    }
    const auto cfg = jobtree::read_config(file);
    if (jobtree::remote_location(cfg) != fs::path("/srv/mirror") ||
        jobtree::remote_location(cfg, "backup").has_value()) {
      return fail(dir, "remote lookup mismatch");
    }

    // set keeps comments and unrelated keys
    jobtree::set_config_value(file, "snapshot.branch_prefix", "run");
    jobtree::set_config_value(file, "email", "a@example.com");
    const auto text = jobtree::fs::read_text(file);
    if (text.find("# jobtree settings\n") != 0 || text.find("some.unknown: kept") == std::string::npos ||
        jobtree::load_snapshot_options(file).branch_prefix != "run" ||
        jobtree::load_identity(file).email != "a@example.com" ||
        jobtree::load_identity(file).name != "A") {
      return fail(dir, "set_config_value lost content");
    }

    // Malformed values
    for (const auto &[key, value] :
         {std::pair{"snapshot.enabled", "maybe"}, std::pair{"snapshot.worktree_dir", "rel/dir"}}) {
      jobtree::ConfigMap bad;
      bad[key] = value;
      bool threw = false;
      try {
        (void)jobtree::snapshot_options_from(bad);
      } catch (const std::invalid_argument &) {
        threw = true;
      }
      if (!threw) {
        return fail(dir, std::string("accepted ") + key + ": " + value);
      }
    }

    // Log level
    jobtree::ConfigMap logcfg;
    logcfg["log.level"] = "debug";
    jobtree::apply_log_level(logcfg);
    if (jobtree::log::level() != jobtree::log::Level::Debug) {
      return fail(dir, "log.level not applied");
    }
    if (jobtree::log::parse_level("loud").has_value() ||
        jobtree::log::parse_level("WARN") != jobtree::log::Level::Warn) {
      return fail(dir, "parse_level mismatch");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    return fail(dir, std::string("exception: ") + e.what());
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
