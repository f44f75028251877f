#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jobtree::fs {

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

std::vector<std::uint8_t> read_file(const std::filesystem::path &p);
std::string read_text(const std::filesystem::path &p);
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path &p, std::string_view text);

inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// mkdtemp(3) under `base`: "<base>/<prefix>XXXXXX". Throws std::system_error.
std::filesystem::path make_unique_dir(const std::filesystem::path &base, std::string_view prefix);

// Copy one non-directory entry: symlinks are recreated as symlinks, regular
// files keep their permission bits. Replaces an existing `dst`.
void copy_entry(const std::filesystem::path &src, const std::filesystem::path &dst);

// remove_all that never follows symlinks and reports instead of throwing.
auto remove_tree(const std::filesystem::path &p) -> std::error_code;

// True if `p` (resolved as far as it exists) lies under `root`.
bool is_within(const std::filesystem::path &p, const std::filesystem::path &root);

bool is_executable(std::filesystem::perms perms);

} // namespace jobtree::fs
