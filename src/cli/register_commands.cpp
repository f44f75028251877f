#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_snapshot(int, char **);
int cmd_provision(int, char **);
int cmd_release(int, char **);
int cmd_worktree(int, char **);
int cmd_config(int, char **);
int cmd_launch(int, char **);

namespace jobtree::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize a new repository");
  register_command("add", ::cmd_add, "Add file(s) to the index: jobtree add <path>... | -A");
  register_command("commit", ::cmd_commit, "Commit staged changes: jobtree commit -m <message>");
  register_command("snapshot", ::cmd_snapshot,
                   "Capture the working tree as a revision: jobtree snapshot [--prefix P] "
                   "[--no-push]");
  register_command("provision", ::cmd_provision,
                   "Check a revision out for one job: jobtree provision <revision> [--job ID] "
                   "[--dir D] [--link P]...");
  register_command("release", ::cmd_release, "Remove a job view: jobtree release <view>");
  register_command("worktree", ::cmd_worktree, "Registered views: jobtree worktree list|prune");
  register_command("config", ::cmd_config,
                   "Read/write settings: jobtree config get <key> | set <key> <value>");
  register_command("launch", ::cmd_launch,
                   "Run a shell command as a batch: jobtree launch [-n N] [--threads] "
                   "[--isolate|--no-isolate] -- <command>");
}

} // namespace jobtree::cli
