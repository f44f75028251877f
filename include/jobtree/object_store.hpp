#pragma once
#include "jobtree/hash.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

struct Object {
  std::string type;               // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// Loose, zlib-compressed objects under <store>/objects/aa/bbbb...
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path store_dir) : store_dir_(std::move(store_dir)) {}

  Object read(std::string_view hex_oid) const;

  // Returns the 40-hex id; writing an existing object is a no-op.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  std::filesystem::path path_for_oid(const oid &object_id) const;
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path;

private:
  std::filesystem::path store_dir_;
};

} // namespace jobtree
