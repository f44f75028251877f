#include "jobtree/registry.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/log.hpp"
#include "jobtree/util.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace stdfs = std::filesystem;
namespace jfs = jobtree::fs;

namespace {

std::mutex &registry_mutex() {
  static std::mutex m;
  return m;
}

void check_name(std::string_view name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos) {
    throw std::runtime_error("invalid worktree name: '" + std::string(name) + "'");
  }
}

auto normalized(const stdfs::path &p) -> stdfs::path {
  std::error_code ec;
  auto out = stdfs::weakly_canonical(p, ec);
  return ec ? p.lexically_normal() : out;
}

} // namespace

namespace jobtree {

RegistryLock::RegistryLock(const Repository &repo) : guard_(registry_mutex()) {
  const auto lock_path = repo.common_dir() / consts::kRegistryLock;
  fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    throw std::system_error(errno, std::generic_category(), "open " + lock_path.string());
  }
  while (::flock(fd_, LOCK_EX) == -1) {
    if (errno == EINTR) {
      continue;
    }
    const int err = errno;
    ::close(fd_);
    throw std::system_error(err, std::generic_category(), "flock " + lock_path.string());
  }
}

RegistryLock::~RegistryLock() {
  // closing the descriptor releases the flock
  ::close(fd_);
}

WorktreeRegistry::WorktreeRegistry(const Repository &repo) : repo_(&repo) {}

auto WorktreeRegistry::admin_dir(std::string_view name) const -> stdfs::path {
  return repo_->worktrees_dir() / std::string(name);
}

bool WorktreeRegistry::contains(std::string_view name) const {
  return jfs::exists(admin_dir(name));
}

auto WorktreeRegistry::add(const RegistryLock & /*held*/, const std::string &name,
                           const stdfs::path &path, std::string_view head_line) const
    -> Repository {
  check_name(name);
  const auto admin = admin_dir(name);
  if (jfs::exists(admin)) {
    throw std::runtime_error("worktree '" + name + "' is already registered");
  }
  const auto work = stdfs::absolute(path);
  if (jfs::exists(work / consts::kStoreDir)) {
    throw std::runtime_error("already a worktree: " + work.string());
  }

  stdfs::create_directories(admin);
  try {
    stdfs::create_directories(work);
    const auto common = stdfs::absolute(repo_->common_dir());
    std::string head(head_line);
    if (!head.ends_with('\n')) {
      head.push_back('\n');
    }
    jfs::write_text_atomic(admin / consts::kHeadFile, head);
    jfs::write_text_atomic(admin / consts::kGitdirFile,
                           (work / consts::kStoreDir).string() + "\n");
    jfs::write_text_atomic(admin / consts::kCommondirFile, common.string() + "\n");
    jfs::write_text_atomic(work / consts::kStoreDir,
                           std::string(consts::kLinkPrefix) + admin.string() + "\n");
  } catch (...) {
    std::error_code ec;
    stdfs::remove_all(admin, ec);
    throw;
  }
  return Repository{work};
}

bool WorktreeRegistry::remove(const RegistryLock & /*held*/, const std::string &name) const {
  check_name(name);
  const auto admin = admin_dir(name);
  if (!jfs::exists(admin)) {
    return false;
  }
  if (const auto ec = jfs::remove_tree(admin)) {
    throw std::system_error(ec, "remove " + admin.string());
  }
  return true;
}

auto WorktreeRegistry::list() const -> std::vector<WorktreeRecord> {
  std::vector<WorktreeRecord> out;
  const auto dir = repo_->worktrees_dir();
  if (!jfs::exists(dir)) {
    return out;
  }
  for (const auto &e : stdfs::directory_iterator(dir)) {
    if (!e.is_directory()) {
      continue;
    }
    WorktreeRecord rec{};
    rec.name = e.path().filename().string();
    const auto gitdir = e.path() / consts::kGitdirFile;
    if (jfs::exists(gitdir)) {
      std::string marker = jfs::read_text(gitdir);
      strutil::rstrip_newlines(marker);
      rec.path = stdfs::path(marker).parent_path();
      rec.prunable = !jfs::exists(marker);
    } else {
      rec.prunable = true;
    }
    const auto head = e.path() / consts::kHeadFile;
    if (jfs::exists(head)) {
      rec.head = jfs::read_text(head);
      strutil::rstrip_newlines(rec.head);
    }
    out.push_back(std::move(rec));
  }
  std::ranges::sort(out, [](const auto &a, const auto &b) { return a.name < b.name; });
  return out;
}

auto WorktreeRegistry::find_by_path(const stdfs::path &path) const
    -> std::optional<WorktreeRecord> {
  const auto want = normalized(path);
  for (auto &rec : list()) {
    if (!rec.path.empty() && normalized(rec.path) == want) {
      return rec;
    }
  }
  return std::nullopt;
}

auto WorktreeRegistry::prune(const RegistryLock &held) const -> std::vector<std::string> {
  std::vector<std::string> pruned;
  for (const auto &rec : list()) {
    if (!rec.prunable) {
      continue;
    }
    if (remove(held, rec.name)) {
      log::debug(log::tag::kCleanup, "pruned stale worktree ", rec.name);
      pruned.push_back(rec.name);
    }
  }
  return pruned;
}

} // namespace jobtree
