// String and object-id helpers shared across the library and CLI
#include "jobtree/util.hpp"

#include "jobtree/consts.hpp"

#include <algorithm>
#include <cctype>

namespace jobtree {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' ||
                         sv.back() == '\n'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_list(std::string_view text, char sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t next = text.find(sep, pos);
    const auto piece = text.substr(pos, next == std::string_view::npos ? text.npos : next - pos);
    if (auto item = trim(piece); !item.empty()) {
      out.push_back(std::move(item));
    }
    if (next == std::string_view::npos) break;
    pos = next + 1;
  }
  return out;
}

std::string shell_quote(std::string_view s) {
  std::string out = "'";
  for (const char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string abbrev(std::string_view hex) {
  return std::string(hex.substr(0, std::min<std::size_t>(hex.size(), 8)));
}

} // namespace strutil

} // namespace jobtree
