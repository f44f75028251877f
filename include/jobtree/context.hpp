#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

enum class IsolationMode : std::uint8_t {
  Isolated, // ran in its own view
  Fallback, // isolation failed, ran against the live tree
  Disabled, // subsystem switched off
};

[[nodiscard]] auto mode_name(IsolationMode mode) -> std::string_view;

// Handed to every task invocation. `working_root` is the code root the task
// must use; on backends that share a process it is the only way to find it.
struct JobContext {
  int job_num = 0;
  std::string job_id;
  std::vector<std::string> args;
  std::filesystem::path working_root;
  std::filesystem::path origin_root;
  IsolationMode mode = IsolationMode::Disabled;
  std::string revision; // empty unless a revision was captured
};

using TaskFn = std::function<int(const JobContext &)>;

struct ExecutionContext {
  std::filesystem::path previous;
  std::filesystem::path target;
};

// Switches the process working directory for one scope and switches it back
// in the destructor. Only one guard may be active per process; a second one
// throws instead of racing the first. Failing to switch throws
// IsolationFailure.
class ExecutionContextGuard {
public:
  explicit ExecutionContextGuard(const std::filesystem::path &target);
  ~ExecutionContextGuard() noexcept;

  ExecutionContextGuard(const ExecutionContextGuard &) = delete;
  auto operator=(const ExecutionContextGuard &) -> ExecutionContextGuard & = delete;
  ExecutionContextGuard(ExecutionContextGuard &&) = delete;
  auto operator=(ExecutionContextGuard &&) -> ExecutionContextGuard & = delete;

  [[nodiscard]] const ExecutionContext &context() const { return ctx_; }

  [[nodiscard]] static bool active();

private:
  ExecutionContext ctx_;
};

// Run `task` with the working directory switched to `view_path`.
auto run(const std::filesystem::path &view_path, const TaskFn &task, const JobContext &ctx)
    -> int;

// Run `task` where we are.
auto run_identity(const TaskFn &task, const JobContext &ctx) -> int;

} // namespace jobtree
