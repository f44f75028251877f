#include "jobtree/time.hpp"

#include <array>
#include <charconv>
#include <cstdio>

namespace jobtree::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{};
  std::tm gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  // Convert both back to epoch and subtract: local - UTC
  gt.tm_isdst = lt.tm_isdst;
  const std::time_t local_epoch = std::mktime(&lt);
  const std::time_t utc_as_local = std::mktime(&gt);
  return static_cast<int>((local_epoch - utc_as_local) / 60);
}

std::string tz_offset_string(int minutes) {
  std::array<char, 8> buf{};
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf.data(), buf.size(), "%c%02d%02d", sign, m / 60, m % 60);
  return {buf.data()};
}

std::string make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(when)) + " " +
         tz_offset_string(tz_minutes);
}

std::optional<std::time_t> signature_time(std::string_view sig) {
  // "... > <epoch> <tz>"
  const auto gt = sig.rfind("> ");
  if (gt == std::string_view::npos)
    return std::nullopt;
  const auto rest = sig.substr(gt + 2);
  long long epoch = 0;
  const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), epoch);
  if (ec != std::errc{} || ptr == rest.data())
    return std::nullopt;
  return static_cast<std::time_t>(epoch);
}

std::string utc_stamp(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm gt{};
  gmtime_r(&t, &gt);
  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y%m%d-%H%M%S", &gt);
  return {buf.data()};
}

std::string micros_stamp(std::chrono::system_clock::time_point when) {
  const auto since = when.time_since_epoch();
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(since) -
                  std::chrono::duration_cast<std::chrono::seconds>(since);
  std::array<char, 8> buf{};
  std::snprintf(buf.data(), buf.size(), "%06lld", static_cast<long long>(us.count()));
  return {buf.data()};
}

} // namespace jobtree::timeutil
