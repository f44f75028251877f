#include "jobtree/fs.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <iterator>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

#include <cstdlib>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace jobtree::fs {

bool exists(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(p, ec);
}

void ensure_parent_dir(const stdfs::path &p) {
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " +
                             ec.message());
}

std::vector<std::uint8_t> read_file(const stdfs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

std::string read_text(const stdfs::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const stdfs::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  // Unique per process and call so that concurrent writers of the same object
  // never share a temp file.
  static std::atomic<unsigned long> counter{0};
  auto tmp = p;
  tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter++);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  stdfs::rename(tmp, p, ec);
  if (ec) {
    stdfs::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

void write_text_atomic(const stdfs::path &p, std::string_view text) {
  write_file_atomic(p, as_bytes(text));
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw std::runtime_error("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib inflate failed");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib inflate: truncated stream");
    }
  }
  inflateEnd(&zs);
  return out;
}

stdfs::path make_unique_dir(const stdfs::path &base, std::string_view prefix) {
  std::string templ = (base / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + templ);
  }
  return {buf.data()};
}

void copy_entry(const stdfs::path &src, const stdfs::path &dst) {
  const auto st = stdfs::symlink_status(src);
  if (!stdfs::is_symlink(st) && !stdfs::is_regular_file(st)) {
    throw std::runtime_error("cannot copy special file: " + src.string());
  }
  ensure_parent_dir(dst);
  // Replace whatever sits at dst; a symlink there must not be written through.
  std::error_code ec;
  if (const auto dst_st = stdfs::symlink_status(dst, ec);
      !ec && dst_st.type() == stdfs::file_type::directory) {
    stdfs::remove_all(dst);
  } else {
    stdfs::remove(dst, ec);
  }
  if (stdfs::is_symlink(st)) {
    stdfs::create_symlink(stdfs::read_symlink(src), dst);
    return;
  }
  stdfs::copy_file(src, dst);
  stdfs::permissions(dst, st.permissions(), stdfs::perm_options::replace);
}

auto remove_tree(const stdfs::path &p) -> std::error_code {
  std::error_code ec;
  stdfs::remove_all(p, ec);
  return ec;
}

bool is_within(const stdfs::path &p, const stdfs::path &root) {
  std::error_code ec;
  const auto rp = stdfs::weakly_canonical(p, ec);
  if (ec) return false;
  const auto rr = stdfs::weakly_canonical(root, ec);
  if (ec) return false;
  const auto root_end = std::mismatch(rr.begin(), rr.end(), rp.begin(), rp.end()).first;
  // weakly_canonical keeps a trailing empty element for "dir/"; ignore it.
  return root_end == rr.end() || (std::next(root_end) == rr.end() && root_end->empty());
}

bool is_executable(stdfs::perms perms) {
  return (perms & stdfs::perms::owner_exec) != stdfs::perms::none;
}

} // namespace jobtree::fs
