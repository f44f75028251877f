#include "jobtree/config.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/index.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/remote.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

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

static std::string commit_file(const jobtree::Repository &repo, const std::string &name,
                               std::string_view body) {
  write_file(repo.root() / name, body);
  jobtree::Index idx{repo};
  idx.load();
  idx.add_path(name);
  idx.save();
  return repo.commit_index(name + "\n");
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("jobtree_remote_" + std::to_string(std::random_device{}()));
  const fs::path local = base / "local";
  const fs::path origin = base / "origin";
  fs::create_directories(local);
  fs::create_directories(origin);

  try {
    const jobtree::Repository lrepo{local};
    lrepo.init();
    const jobtree::Repository rrepo{origin};
    rrepo.init();
    (void)commit_file(lrepo, "a.txt", "one\n");
    write_file(local / "dirty.txt", "uncommitted\n");

    // No remote configured: the revision is still created, just not published
    const auto unpublished = jobtree::SnapshotManager{local}.create_revision("job", true);
    if (unpublished.published || jobtree::read_ref(rrepo, unpublished.branch_ref())) {
      return fail(base, "published without a remote");
    }

    jobtree::set_config_value(lrepo.config_file(), "remote.origin", origin.string());
    const auto rec = jobtree::SnapshotManager{local}.create_revision("job", true);
    if (!rec.published || jobtree::read_ref(rrepo, rec.branch_ref()) != rec.commit) {
      return fail(base, "revision branch not published");
    }
    // Objects came along
    const auto info = rrepo.read_commit(rec.commit);
    if (info.parents.empty() || info.message.rfind("Snapshot ", 0) != 0) {
      return fail(base, "published commit unreadable on the remote");
    }

    // Non-fast-forward is refused
    const std::string theirs = commit_file(rrepo, "r.txt", "remote\n");
    jobtree::update_ref(rrepo, jobtree::heads_ref("shared"), theirs);
    const std::string ours = commit_file(lrepo, "b.txt", "two\n");
    jobtree::update_ref(lrepo, jobtree::heads_ref("shared"), ours);
    bool threw = false;
    try {
      jobtree::remote::publish_branch(lrepo, origin, "shared");
    } catch (const jobtree::PushFailure &) {
      threw = true;
    }
    if (!threw || jobtree::read_ref(rrepo, jobtree::heads_ref("shared")) != theirs) {
      return fail(base, "non-fast-forward push was not refused");
    }

    // Not a store
    threw = false;
    try {
      jobtree::remote::publish_branch(lrepo, base / "nothing", rec.id);
    } catch (const jobtree::PushFailure &) {
      threw = true;
    }
    if (!threw) {
      return fail(base, "push to a non-store should fail");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    return fail(base, std::string("exception: ") + e.what());
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
