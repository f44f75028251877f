#include "jobtree/locator.hpp"

#include "jobtree/consts.hpp"
#include "jobtree/errors.hpp"

#include <system_error>

namespace stdfs = std::filesystem;

namespace jobtree {

auto locate_root(const stdfs::path &start) -> stdfs::path {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec) {
    throw NotAVersionedTree(start);
  }
  dir = dir.lexically_normal();
  if (!dir.has_filename() && dir != dir.root_path()) {
    dir = dir.parent_path(); // trailing separator
  }

  for (;;) {
    const auto marker = dir / consts::kStoreDir;
    const auto st = stdfs::symlink_status(marker, ec);
    if (!ec && (stdfs::is_directory(st) || stdfs::is_regular_file(st))) {
      return dir;
    }
    if (dir == dir.root_path() || !dir.has_parent_path()) {
      break;
    }
    dir = dir.parent_path();
  }
  throw NotAVersionedTree(start);
}

auto locate_root() -> stdfs::path { return locate_root(stdfs::current_path()); }

} // namespace jobtree
