#include "jobtree/refs.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/fs.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/util.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stdfs = std::filesystem;

namespace jobtree {

static stdfs::path ref_path(const Repository &repo, const std::string &refname) {
  if (refname.empty() || refname.find("..") != std::string::npos || refname.front() == '/') {
    throw std::runtime_error("invalid ref name: " + refname);
  }
  return repo.common_dir() / refname;
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsRefPrefix) + std::string(branch);
}

std::optional<std::string> read_HEAD(const Repository &repo) {
  const auto p = repo.head_file();
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  return fs::read_text(p);
}

void set_HEAD_symbolic(const Repository &repo, const std::string &refname) {
  fs::write_text_atomic(repo.head_file(), std::string(consts::kRefPrefix) + refname + "\n");
}

void set_HEAD_detached(const Repository &repo, std::string_view hex_oid) {
  fs::write_text_atomic(repo.head_file(), std::string(hex_oid) + "\n");
}

std::optional<std::string> read_ref(const Repository &repo, const std::string &refname) {
  const auto p = ref_path(repo, refname);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid) {
  if (!looks_hex40(hex_oid)) {
    throw std::runtime_error("update_ref: not an object id: " + hex_oid);
  }
  fs::write_text_atomic(ref_path(repo, refname), hex_oid + "\n");
}

bool delete_ref(const Repository &repo, const std::string &refname) {
  std::error_code ec;
  return stdfs::remove(ref_path(repo, refname), ec) && !ec;
}

std::vector<std::string> list_branches(const Repository &repo, std::string_view prefix) {
  std::vector<std::string> out;
  const auto heads = repo.heads_dir();
  if (!fs::exists(heads)) {
    return out;
  }
  for (const auto &e : stdfs::recursive_directory_iterator(heads)) {
    if (!e.is_regular_file()) {
      continue;
    }
    const std::string name = stdfs::relative(e.path(), heads).generic_string();
    // skip in-flight temp files from write_file_atomic
    if (name.find(".tmp.") != std::string::npos) {
      continue;
    }
    if (name.starts_with(prefix)) {
      out.push_back(name);
    }
  }
  std::ranges::sort(out);
  return out;
}

} // namespace jobtree
