#include "jobtree/cleanup.hpp"
#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/index.hpp"
#include "jobtree/isolation.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/registry.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <set>
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

static auto count_entries(const fs::path &dir) -> std::ptrdiff_t {
  return std::distance(fs::directory_iterator(dir), fs::directory_iterator{});
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("jobtree_isolation_" + std::to_string(std::random_device{}()));
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
    write_file(root / "notes.txt", "untracked\n");

    const auto rec = jobtree::SnapshotManager{root}.create_revision("iso", false);
    write_file(root / "late.txt", "after capture\n");

    jobtree::IsolationProvisioner provisioner{root};
    jobtree::CleanupCoordinator cleanup{root};
    if (provisioner.default_base_dir() != base) {
      return fail(base, "default base dir should be the tree's parent");
    }

    std::vector<jobtree::IsolatedView> jobs;
    for (const char *id : {"0", "1", "2"}) {
      jobs.push_back(provisioner.provision(rec, id, views, {"outputs"}));
    }

    std::set<fs::path> distinct;
    for (const auto &v : jobs) {
      distinct.insert(v.path);
      if (jobtree::fs::read_text(v.path / "notes.txt") != "untracked\n" ||
          jobtree::fs::read_text(v.path / "app.py") != "print(1)\n") {
        return fail(base, "view content mismatch in " + v.path.string());
      }
      if (fs::exists(v.path / "late.txt")) {
        return fail(base, "content added after capture leaked into a view");
      }
      if (!fs::is_symlink(v.path / "outputs") || v.redirects.size() != 1) {
        return fail(base, "outputs is not redirected in " + v.path.string());
      }
      const jobtree::Repository checkout{v.path};
      if (!checkout.is_linked() || checkout.head_commit() != rec.commit ||
          checkout.head_ref().has_value()) {
        return fail(base, "view is not a detached checkout of the revision");
      }
      write_file(v.path / "outputs" / ("job" + v.job_id + ".txt"), v.job_id);
    }
    if (distinct.size() != 3) {
      return fail(base, "views share a path");
    }
    for (const char *id : {"0", "1", "2"}) {
      if (!fs::exists(root / "outputs" / (std::string("job") + id + ".txt"))) {
        return fail(base, "redirected write missing in the originating tree");
      }
    }
    if (jobtree::WorktreeRegistry{repo}.list().size() != 3) {
      return fail(base, "expected three registered views");
    }

    // Redirects that would escape the tree
    const auto before = count_entries(views);
    for (const char *bad : {"../escape", "/abs/path", ""}) {
      bool threw = false;
      try {
        (void)provisioner.provision(rec, "9", views, {"outputs", bad});
      } catch (const jobtree::SymlinkConflict &) {
        threw = true;
      }
      if (!threw) {
        return fail(base, std::string("expected SymlinkConflict for '") + bad + "'");
      }
    }
    if (count_entries(views) != before || jobtree::WorktreeRegistry{repo}.list().size() != 3) {
      return fail(base, "failed provision left state behind");
    }

    // Container cannot be created
    bool threw = false;
    try {
      (void)provisioner.provision(rec, "9", base / "missing" / "deeper", {});
    } catch (const jobtree::WorktreeCreationFailure &) {
      threw = true;
    }
    if (!threw) {
      return fail(base, "expected WorktreeCreationFailure for a missing base dir");
    }
    if (::geteuid() != 0) {
      const fs::path ro = base / "readonly";
      fs::create_directories(ro);
      fs::permissions(ro, fs::perms::owner_read | fs::perms::owner_exec);
      threw = false;
      try {
        (void)provisioner.provision(rec, "9", ro, {});
      } catch (const jobtree::WorktreeCreationFailure &) {
        threw = true;
      }
      fs::permissions(ro, fs::perms::owner_all);
      if (!threw) {
        return fail(base, "expected WorktreeCreationFailure for an unwritable base dir");
      }
    }

    // Redirect through a checked-out symlink that leaves the tree
    {
      const fs::path shared = base / "shared_data";
      const fs::path other = base / "linked_tree";
      write_file(shared / "out" / "precious.bin", "keep me\n");
      fs::create_directories(other);
      const jobtree::Repository other_repo{other};
      other_repo.init();
      fs::create_directory_symlink(shared, other / "data");
      const auto linked_rec = jobtree::SnapshotManager{other}.create_revision("iso", false);
      jobtree::IsolationProvisioner other_prov{other};

      const auto other_before = count_entries(views);
      for (const char *rel : {"data/out", "data/fresh"}) {
        threw = false;
        try {
          (void)other_prov.provision(linked_rec, "7", views, {rel});
        } catch (const jobtree::SymlinkConflict &) {
          threw = true;
        }
        if (!threw) {
          return fail(base, std::string("expected SymlinkConflict for '") + rel + "'");
        }
      }

      // The origin no longer routes through the link; only the view does.
      fs::remove(other / "data");
      fs::create_directories(other / "data" / "out");
      threw = false;
      try {
        (void)other_prov.provision(linked_rec, "8", views, {"data/out"});
      } catch (const jobtree::SymlinkConflict &) {
        threw = true;
      }
      if (!threw) {
        return fail(base, "expected SymlinkConflict for a symlinked parent inside the view");
      }

      if (jobtree::fs::read_text(shared / "out" / "precious.bin") != "keep me\n") {
        return fail(base, "redirect removed content outside the view");
      }
      if (fs::exists(shared / "fresh")) {
        return fail(base, "redirect created a directory outside the originating tree");
      }
      if (count_entries(views) != other_before ||
          !jobtree::WorktreeRegistry{other_repo}.list().empty()) {
        return fail(base, "failed redirect left state behind");
      }
    }

    // Release: views go, outputs and the revision stay
    for (const auto &v : jobs) {
      cleanup.release(v);
      if (fs::exists(v.container)) {
        return fail(base, "container survived release");
      }
    }
    if (!fs::exists(root / "outputs" / "job0.txt") ||
        !jobtree::read_ref(repo, rec.branch_ref()).has_value() ||
        !jobtree::WorktreeRegistry{repo}.list().empty()) {
      return fail(base, "release removed too much or too little");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    return fail(base, std::string("exception: ") + e.what());
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
