#include "jobtree/index.hpp"

#include "jobtree/fs.hpp"
#include "jobtree/hash.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/util.hpp"
#include "jobtree/worktree.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace jobtree {

Index::Index(const Repository &repo) : repo_(&repo) {}

void Index::sort_entries() {
  std::ranges::sort(entries_, [](const auto &a, const auto &b) { return a.path < b.path; });
}

void Index::load() {
  entries_.clear();
  const auto p = repo_->index_file();
  if (!fs::exists(p))
    return;

  std::istringstream iss(fs::read_text(p));
  std::string line;
  while (std::getline(iss, line)) {
    line = strutil::trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    // format: "<octal> <hex> <path>"
    const auto sp1 = line.find(' ');
    const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos)
      continue; // skip malformed
    const std::string_view mode_str = std::string_view(line).substr(0, sp1);
    const std::string_view hex = std::string_view(line).substr(sp1 + 1, sp2 - sp1 - 1);
    std::string path = line.substr(sp2 + 1);

    std::uint32_t mode = 0;
    for (const char c : mode_str) {
      if (c < '0' || c > '7') {
        mode = 0;
        break;
      }
      mode = (mode << 3U) + static_cast<std::uint32_t>(c - '0');
    }
    IndexEntry e{.mode = mode, .id = {}, .path = std::move(path)};
    if (mode == 0 || e.path.empty() || !from_hex(hex, e.id))
      continue;
    entries_.push_back(std::move(e));
  }
  sort_entries();
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &e : entries_) {
    std::array<char, 16> mode_buf{};
    std::snprintf(mode_buf.data(), mode_buf.size(), "%o", e.mode);
    os << mode_buf.data() << ' ' << to_hex(e.id) << ' ' << e.path << '\n';
  }
  fs::write_text_atomic(repo_->index_file(), os.str());
}

void Index::add_path(std::string_view relpath) {
  const auto abs = repo_->root() / std::filesystem::path(relpath);
  const std::uint32_t mode = worktree::mode_of(abs);
  const auto hex_oid = repo_->write_blob(worktree::blob_bytes(abs, mode));

  oid bin{};
  if (!from_hex(hex_oid, bin)) {
    throw std::runtime_error("write_blob produced bad hex oid");
  }

  std::string path(relpath);
  const auto it =
      std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->mode = mode;
    it->id = bin;
  } else {
    entries_.push_back(IndexEntry{.mode = mode, .id = bin, .path = std::move(path)});
  }
  sort_entries();
}

void Index::remove_path(std::string_view relpath) {
  const std::string key(relpath);
  std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == key; });
}

std::size_t Index::stage_all() {
  worktree::PathSet tracked;
  for (const auto &e : entries_) {
    tracked.insert(e.path);
  }
  worktree::PathSet paths;
  worktree::enumerate_paths(repo_->root(), paths, tracked);

  entries_.clear();
  entries_.reserve(paths.size());
  for (const auto &rel : paths) {
    const auto abs = repo_->root() / rel;
    const std::uint32_t mode = worktree::mode_of(abs);
    IndexEntry e{.mode = mode, .id = {}, .path = rel};
    if (!from_hex(repo_->write_blob(worktree::blob_bytes(abs, mode)), e.id)) {
      throw std::runtime_error("write_blob produced bad hex oid");
    }
    entries_.push_back(std::move(e));
  }
  sort_entries();
  return entries_.size();
}

void Index::assign(std::vector<IndexEntry> entries) {
  entries_ = std::move(entries);
  sort_entries();
}

std::map<std::string, std::string> Index::as_path_oid_map() const {
  std::map<std::string, std::string> m;
  for (const auto &e : entries_) {
    m[e.path] = to_hex(e.id);
  }
  return m;
}

} // namespace jobtree
