#include "jobtree/repo.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/index.hpp"
#include "jobtree/object_store.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/time.hpp"
#include "jobtree/util.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace jfs   = jobtree::fs;

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}
} // namespace

namespace jobtree {

Repository::Repository(stdfs::path root) : root_(std::move(root)) {
  const auto marker = root_ / consts::kStoreDir;
  std::error_code ec;
  if (!stdfs::is_regular_file(marker, ec)) {
    store_dir_ = marker;
    common_dir_ = marker;
    return;
  }

  // Linked worktree: ".jobtree" is a file naming the admin dir.
  std::string text = jfs::read_text(marker);
  strutil::rstrip_newlines(text);
  if (!text.starts_with(consts::kLinkPrefix)) {
    throw std::runtime_error("malformed worktree link file: " + marker.string());
  }
  store_dir_ = stdfs::path(text.substr(consts::kLinkPrefix.size()));
  if (store_dir_.is_relative()) {
    store_dir_ = root_ / store_dir_;
  }
  const auto commondir = store_dir_ / consts::kCommondirFile;
  if (jfs::exists(commondir)) {
    std::string common = jfs::read_text(commondir);
    strutil::rstrip_newlines(common);
    common_dir_ = stdfs::path(common);
  } else {
    // <common>/worktrees/<name>
    common_dir_ = store_dir_.parent_path().parent_path();
  }
  linked_ = true;
}

auto Repository::is_initialized() const -> bool {
  return stdfs::exists(store_dir_) && stdfs::exists(objects_dir());
}

void Repository::init(const Identity &identity) const {
  if (stdfs::exists(root_ / consts::kStoreDir)) {
    throw std::runtime_error("A jobtree repository already exists at: " +
                             (root_ / consts::kStoreDir).string());
  }

  for (const auto &dir : {objects_dir(), heads_dir(), tags_dir(), worktrees_dir()}) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());
    }
  }

  set_HEAD_symbolic(*this, heads_ref(consts::kDefaultBranch));
  save_identity(config_file(), identity);
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  const ObjectStore store{common_dir_};
  return store.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  const ObjectStore store{common_dir_};
  auto [type, data] = store.read(hex_oid);
  if (type != consts::kTypeBlob) {
    throw std::runtime_error("object is not a blob: " + std::string(hex_oid));
  }
  return std::move(data);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry> &entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries,
                    [](const TreeEntry &a, const TreeEntry &b) { return a.name < b.name; });

  std::string data;
  for (const auto &e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(e.id.data()), consts::kOidRawLen);
  }

  const ObjectStore store{common_dir_};
  return store.write(consts::kTypeTree, jfs::as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const ObjectStore os{common_dir_};
  const auto [type, data] = os.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw std::runtime_error("object is not a tree: " + std::string(hex_oid));
  }

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string> &parent_hexes,
                              std::string_view author_line, std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;

  for (const auto &p : parent_hexes) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;

  const ObjectStore store{common_dir_};
  return store.write(consts::kTypeCommit, jfs::as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const ObjectStore store{common_dir_};
  const auto obj = store.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw std::runtime_error("object is not a commit: " + std::string(commit_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  return info;
}

auto Repository::is_commit_ancestor(std::string_view ancestor_hex,
                                    std::string_view descendant_hex) const -> bool {
  if (ancestor_hex == descendant_hex) return true;
  std::vector<std::string> stack{std::string(descendant_hex)};
  std::set<std::string> seen;
  while (!stack.empty()) {
    const auto cur = stack.back();
    stack.pop_back();
    if (!seen.insert(cur).second) continue;
    const auto info = read_commit(cur);
    for (const auto &p : info.parents) {
      if (p == ancestor_hex) return true;
      stack.push_back(p);
    }
  }
  return false;
}

// HEAD

auto Repository::head_ref() const -> std::optional<std::string> {
  auto head_txt = read_HEAD(*this);
  if (!head_txt) return std::nullopt;
  strutil::rstrip_newlines(*head_txt);
  if (!head_txt->starts_with(consts::kRefPrefix)) return std::nullopt;
  return head_txt->substr(consts::kRefPrefix.size());
}

auto Repository::head_commit() const -> std::optional<std::string> {
  auto head_txt = read_HEAD(*this);
  if (!head_txt) return std::nullopt;
  strutil::rstrip_newlines(*head_txt);
  if (head_txt->starts_with(consts::kRefPrefix)) {
    const auto tip = read_ref(*this, head_txt->substr(consts::kRefPrefix.size()));
    if (tip && looks_hex40(*tip)) return tip;
    return std::nullopt; // unborn branch
  }
  if (looks_hex40(*head_txt)) return head_txt;
  return std::nullopt;
}

auto Repository::resolve(std::string_view rev) const -> std::optional<std::string> {
  if (looks_hex40(rev)) {
    const ObjectStore store{common_dir_};
    if (store.contains(rev)) return std::string(rev);
    return std::nullopt;
  }
  auto tip = read_ref(*this, heads_ref(rev));
  if (tip && looks_hex40(*tip)) return tip;
  return std::nullopt;
}

auto Repository::write_tree_from_index() const -> std::string {
  Index idx{*this};
  idx.load();
  const auto &ents = idx.entries();

  const auto build = [&](const auto &self, const std::vector<IndexEntry> &group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto &e : group) {
      const auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = first, .id = e.id});
      } else {
        IndexEntry child = e;
        child.path = rest;
        subdirs[first].push_back(std::move(child));
      }
    }

    for (auto &[dirname, child_entries] : subdirs) {
      const std::string subtree_hex = self(self, child_entries);

      TreeEntry te{.mode = consts::kModeTree, .name = dirname, .id = {}};
      if (!from_hex(subtree_hex, te.id)) {
        throw std::runtime_error("bad subtree hex oid");
      }
      tree_entries.push_back(std::move(te));
    }

    return write_tree(tree_entries);
  };

  return build(build, ents);
}

auto Repository::commit_index(std::string_view message) const -> std::string {
  if (!is_initialized()) {
    throw std::runtime_error("Not a jobtree repository (missing .jobtree): " + root_.string());
  }

  const std::string tree_hex = write_tree_from_index();

  std::vector<std::string> parents;
  if (auto cur = head_commit()) {
    parents.push_back(std::move(*cur));
  }

  Identity id = load_identity(config_file());
  if (id.name.empty()) id.name = "jobtree";
  if (id.email.empty()) id.email = "jobtree@localhost";
  const std::time_t now = std::time(nullptr);
  const int tz_min = timeutil::local_utc_offset_minutes(now);
  const std::string sig = timeutil::make_signature(id, now, tz_min);

  const std::string commit_hex = write_commit(tree_hex, parents, sig, sig, message);

  if (const auto branch = head_ref()) {
    update_ref(*this, *branch, commit_hex);
  } else {
    set_HEAD_detached(*this, commit_hex);
  }
  return commit_hex;
}

} // namespace jobtree
