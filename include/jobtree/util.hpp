#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

namespace strutil {
// Strip trailing CR/LF characters in place
void rstrip_newlines(std::string &str);

// Trim spaces, tabs and CR on both ends
auto trim(std::string_view sv) -> std::string;

// Split on `sep`, trimming each item and dropping empty ones
auto split_list(std::string_view text, char sep) -> std::vector<std::string>;

// Single-quote for /bin/sh
auto shell_quote(std::string_view s) -> std::string;

auto abbrev(std::string_view hex) -> std::string;
} // namespace strutil

} // namespace jobtree
