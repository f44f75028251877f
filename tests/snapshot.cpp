#include "jobtree/errors.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/index.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/registry.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/snapshot.hpp"
#include "jobtree/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string blob_text(const jobtree::Repository &repo, const jobtree::worktree::Snapshot &m,
                             const std::string &path) {
  const auto bytes = repo.read_blob(m.at(path).hex);
  return {bytes.begin(), bytes.end()};
}

static int fail(const fs::path &base, const std::string &msg) {
  std::cerr << msg << "\n";
  std::error_code ec;
  fs::remove_all(base, ec);
  return 1;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("jobtree_snapshot_" + std::to_string(std::random_device{}()));
  const fs::path root = base / "tree";
  fs::create_directories(root);

  try {
    const jobtree::Repository repo{root};
    repo.init();
    write_file(root / "app.py", "print(1)\n");
    write_file(root / ".jobtreeignore", "*.log\n");
    jobtree::Index idx{repo};
    idx.load();
    idx.add_path("app.py");
    idx.add_path(".jobtreeignore");
    idx.save();
    const std::string c1 = repo.commit_index("init\n");

    // Dirty tree: unstaged edit, untracked file, ignored file
    write_file(root / "app.py", "print(2)\n");
    write_file(root / "notes.txt", "remember\n");
    write_file(root / "debug.log", "noise\n");
    const std::string index_before = jobtree::fs::read_text(repo.index_file());
    const std::string head_before = jobtree::fs::read_text(repo.head_file());

    jobtree::SnapshotManager snapshots{root};
    const auto rec = snapshots.create_revision("slurm-job", false);

    if (!rec.id.starts_with("slurm-job-") || rec.base_commit != c1 || rec.commit == c1 ||
        rec.published) {
      return fail(base, "unexpected revision record " + rec.id);
    }
    const auto files =
        jobtree::worktree::tree_to_map(repo, repo.read_commit(rec.commit).tree_hex);
    if (!files.contains("notes.txt") || files.contains("debug.log") ||
        blob_text(repo, files, "app.py") != "print(2)\n" ||
        blob_text(repo, files, "notes.txt") != "remember\n") {
      return fail(base, "revision content does not match the working tree");
    }
    if (jobtree::read_ref(repo, rec.branch_ref()) != rec.commit) {
      return fail(base, "revision branch missing");
    }

    // The user's HEAD, index and files are untouched
    if (jobtree::fs::read_text(repo.index_file()) != index_before ||
        jobtree::fs::read_text(repo.head_file()) != head_before || repo.head_commit() != c1 ||
        jobtree::fs::read_text(root / "app.py") != "print(2)\n") {
      return fail(base, "snapshot modified the originating tree");
    }
    // The side worktree is gone
    if (!jobtree::WorktreeRegistry{repo}.list().empty()) {
      return fail(base, "side worktree left registered");
    }

    // Two calls, two revisions, even within the same second
    const auto rec2 = snapshots.create_revision("slurm-job", false);
    if (rec2.id == rec.id) {
      return fail(base, "revision ids collide: " + rec.id);
    }
    if (snapshots.list_revisions("slurm-job").size() != 2) {
      return fail(base, "expected two revisions");
    }

    // Lookup by id
    const auto found = snapshots.find_revision(rec.id);
    if (!found || found->commit != rec.commit || found->base_commit != c1) {
      return fail(base, "find_revision mismatch");
    }
    if (snapshots.find_revision("slurm-job-nope").has_value()) {
      return fail(base, "find_revision found a missing revision");
    }

    if (repo.read_commit(rec.commit).message.find("Jobtree-Revision: " + rec.id + "\n") ==
        std::string::npos) {
      return fail(base, "capture commit does not name its revision");
    }

    // Clean tree: the revision is the HEAD commit itself, even when the user's
    // own subject looks like a capture.
    idx.load();
    idx.stage_all();
    idx.save();
    const std::string c2 = repo.commit_index("Snapshot by hand\n");
    const auto clean = snapshots.create_revision("clean", false);
    if (clean.commit != c2 || clean.base_commit != c2) {
      return fail(base, "clean tree should not produce a new commit");
    }
    const auto clean_found = snapshots.find_revision(clean.id);
    if (!clean_found || clean_found->base_commit != c2) {
      return fail(base, "clean revision lookup reported the wrong base");
    }

    // Unborn HEAD: always commits, no base
    const fs::path fresh = base / "fresh";
    fs::create_directories(fresh);
    const jobtree::Repository fresh_repo{fresh};
    fresh_repo.init();
    write_file(fresh / "only.txt", "x\n");
    const auto first = jobtree::SnapshotManager{fresh}.create_revision("job", false);
    if (!first.base_commit.empty() || !fresh_repo.read_commit(first.commit).parents.empty()) {
      return fail(base, "unborn snapshot should be a root commit");
    }
    if (fresh_repo.head_commit().has_value()) {
      return fail(base, "unborn HEAD of the user moved");
    }

    // Not a store
    bool threw = false;
    try {
      (void)jobtree::SnapshotManager{base / "nowhere"}.create_revision("x", false);
    } catch (const jobtree::SnapshotCreationFailure &) {
      threw = true;
    }
    if (!threw) {
      return fail(base, "expected SnapshotCreationFailure");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    return fail(base, std::string("exception: ") + e.what());
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
