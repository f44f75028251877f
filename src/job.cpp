#include "jobtree/job.hpp"

#include <charconv>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

namespace jobtree {

namespace {

void put(std::string &out, std::string_view key, std::string_view value) {
  out.append(key);
  out.push_back(' ');
  out.append(std::to_string(value.size()));
  out.push_back('\n');
  out.append(value);
  out.push_back('\n');
}

auto to_int(std::string_view key, std::string_view text) -> int {
  int v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw std::runtime_error("job return: bad integer for " + std::string(key));
  }
  return v;
}

} // namespace

auto status_name(JobStatus status) -> std::string_view {
  return status == JobStatus::Completed ? "completed" : "failed";
}

auto encode(const JobReturn &ret) -> std::string {
  std::string out;
  put(out, "num", std::to_string(ret.num));
  put(out, "status", status_name(ret.status));
  put(out, "value", std::to_string(ret.return_value));
  put(out, "mode", mode_name(ret.mode));
  put(out, "revision", ret.revision);
  put(out, "view", ret.view.string());
  put(out, "error", ret.error);
  return out;
}

auto decode_job_return(std::string_view wire) -> JobReturn {
  std::map<std::string, std::string, std::less<>> fields;
  std::size_t pos = 0;
  while (pos < wire.size()) {
    const auto sp = wire.find(' ', pos);
    const auto nl = sp == std::string_view::npos ? sp : wire.find('\n', sp);
    if (nl == std::string_view::npos) {
      throw std::runtime_error("job return: truncated header");
    }
    const auto key = wire.substr(pos, sp - pos);
    const auto len = static_cast<std::size_t>(to_int(key, wire.substr(sp + 1, nl - sp - 1)));
    if (nl + 1 + len + 1 > wire.size() || wire[nl + 1 + len] != '\n') {
      throw std::runtime_error("job return: truncated field " + std::string(key));
    }
    fields.emplace(std::string(key), std::string(wire.substr(nl + 1, len)));
    pos = nl + 1 + len + 1;
  }

  const auto get = [&](std::string_view key) -> const std::string & {
    const auto it = fields.find(key);
    if (it == fields.end()) {
      throw std::runtime_error("job return: missing " + std::string(key));
    }
    return it->second;
  };

  JobReturn ret{};
  ret.num = to_int("num", get("num"));
  ret.status = get("status") == "completed" ? JobStatus::Completed : JobStatus::Failed;
  ret.return_value = to_int("value", get("value"));
  const auto &mode = get("mode");
  if (mode == "isolated") {
    ret.mode = IsolationMode::Isolated;
  } else if (mode == "fallback") {
    ret.mode = IsolationMode::Fallback;
  } else {
    ret.mode = IsolationMode::Disabled;
  }
  ret.revision = get("revision");
  ret.view = get("view");
  ret.error = get("error");
  return ret;
}

} // namespace jobtree
