#include "jobtree/ignore.hpp"
#include "jobtree/index.hpp"
#include "jobtree/repo.hpp"
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

static bool check(bool ok, const char *what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
  }
  return ok;
}

int main() {
  // Pattern semantics
  {
    jobtree::IgnoreRules rules;
    rules.add_pattern("# comment", "");
    rules.add_pattern("", "");
    rules.add_pattern("*.log", "");
    rules.add_pattern("!keep.log", "");
    rules.add_pattern("build/", "");
    rules.add_pattern("docs/*.tmp", "");
    rules.add_pattern("cache", "sub");

    bool ok = true;
    ok &= check(rules.rules().size() == 5, "comments and blanks skipped");
    ok &= check(rules.is_ignored("x.log", false), "glob at root");
    ok &= check(rules.is_ignored("deep/down/x.log", false), "basename at any depth");
    ok &= check(!rules.is_ignored("keep.log", false), "negation wins when later");
    ok &= check(rules.is_ignored("build", true), "dir-only matches a directory");
    ok &= check(!rules.is_ignored("build", false), "dir-only skips files");
    ok &= check(rules.is_ignored("docs/a.tmp", false), "anchored pattern");
    ok &= check(!rules.is_ignored("other/docs/a.tmp", false), "anchored only at its base");
    ok &= check(rules.is_ignored("sub/x/cache", false), "scoped rule inside its dir");
    ok &= check(!rules.is_ignored("cache", false), "scoped rule outside its dir");
    if (!ok) {
      return 1;
    }
  }

  const fs::path root =
      fs::temp_directory_path() / ("jobtree_ignore_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    jobtree::Repository repo{root};
    repo.init();

    write_file(root / ".jobtreeignore", "*.log\nbuild/\n");
    write_file(root / "app.py", "print(1)\n");
    write_file(root / "run.log", "noise\n");
    write_file(root / "build" / "out.o", "obj\n");
    write_file(root / "pkg" / ".jobtreeignore", "gen_*\n");
    write_file(root / "pkg" / "gen_a.py", "generated\n");
    write_file(root / "pkg" / "mod.py", "x = 1\n");
    write_file(root / "tracked.log", "forced\n");

    jobtree::worktree::PathSet paths;
    jobtree::worktree::enumerate_paths(root, paths);
    const jobtree::worktree::PathSet want{".jobtreeignore", "app.py", "pkg/.jobtreeignore",
                                          "pkg/mod.py"};
    if (paths != want) {
      std::cerr << "enumerate_paths returned:";
      for (const auto &p : paths) {
        std::cerr << " " << p;
      }
      std::cerr << "\n";
      fs::remove_all(root);
      return 1;
    }

    // A path tracked before it became ignored stays tracked under add -A
    jobtree::Index idx{repo};
    idx.load();
    idx.add_path("tracked.log");
    idx.save();
    idx.load();
    const auto n = idx.stage_all();
    const auto staged = idx.as_path_oid_map();
    if (n != 5 || !staged.contains("tracked.log") || staged.contains("run.log") ||
        staged.contains("build/out.o")) {
      std::cerr << "stage_all staged " << n << " path(s)\n";
      fs::remove_all(root);
      return 1;
    }

    // Deleted tracked files drop out
    fs::remove(root / "tracked.log");
    idx.stage_all();
    if (idx.as_path_oid_map().contains("tracked.log")) {
      std::cerr << "deleted file still staged\n";
      fs::remove_all(root);
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
