#pragma once
#include "jobtree/context.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

struct JobSpec {
  int num = 0;
  std::string id;
  std::vector<std::string> args;
};

enum class JobStatus : std::uint8_t { Completed, Failed };

[[nodiscard]] auto status_name(JobStatus status) -> std::string_view;

// Outcome of one job. `status` is about the task only; how it was isolated
// is reported separately in `mode`.
struct JobReturn {
  int num = -1;
  JobStatus status = JobStatus::Failed;
  int return_value = 0;
  IsolationMode mode = IsolationMode::Disabled;
  std::string revision;
  std::filesystem::path view; // empty unless isolated
  std::string error;
};

// Wire form used between a job process and the launcher:
// "<key> <byte count>\n<bytes>\n" per field.
auto encode(const JobReturn &ret) -> std::string;
auto decode_job_return(std::string_view wire) -> JobReturn;

} // namespace jobtree
