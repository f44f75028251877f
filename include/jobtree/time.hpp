#pragma once
#include "jobtree/config.hpp"

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace jobtree::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Build "Name <email> 1714412345 +0300"
auto make_signature(const Identity &identity, std::time_t when, int tz_minutes) -> std::string;

// Epoch seconds from a signature line; nullopt if it does not parse.
auto signature_time(std::string_view signature) -> std::optional<std::time_t>;

// UTC "%Y%m%d-%H%M%S", used in revision identifiers
auto utc_stamp(std::chrono::system_clock::time_point when) -> std::string;

// Microseconds within the second, zero padded to 6 digits
auto micros_stamp(std::chrono::system_clock::time_point when) -> std::string;

} // namespace jobtree::timeutil
