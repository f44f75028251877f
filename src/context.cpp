#include "jobtree/context.hpp"

#include "jobtree/errors.hpp"
#include "jobtree/log.hpp"

#include <atomic>
#include <system_error>

namespace stdfs = std::filesystem;

namespace jobtree {

namespace {
std::atomic<bool> g_switched{false};
} // namespace

auto mode_name(IsolationMode mode) -> std::string_view {
  switch (mode) {
  case IsolationMode::Isolated:
    return "isolated";
  case IsolationMode::Fallback:
    return "fallback";
  case IsolationMode::Disabled:
    return "disabled";
  }
  return "unknown";
}

ExecutionContextGuard::ExecutionContextGuard(const stdfs::path &target) {
  bool expected = false;
  if (!g_switched.compare_exchange_strong(expected, true)) {
    throw IsolationFailure(
        "working directory is already switched in this process; refusing to switch to " +
        target.string());
  }
  std::error_code ec;
  ctx_.previous = stdfs::current_path(ec);
  if (!ec) {
    stdfs::current_path(target, ec);
  }
  if (ec) {
    g_switched.store(false);
    throw IsolationFailure("cannot switch to " + target.string() + ": " + ec.message());
  }
  ctx_.target = target;
  log::debug(log::tag::kIsolation, "cwd ", ctx_.previous.string(), " -> ", target.string());
}

ExecutionContextGuard::~ExecutionContextGuard() noexcept {
  std::error_code ec;
  stdfs::current_path(ctx_.previous, ec);
  if (ec) {
    log::error(log::tag::kIsolation, "cannot restore cwd ", ctx_.previous.string(), ": ",
               ec.message());
  }
  g_switched.store(false);
}

bool ExecutionContextGuard::active() { return g_switched.load(); }

auto run(const stdfs::path &view_path, const TaskFn &task, const JobContext &ctx) -> int {
  const ExecutionContextGuard guard{view_path};
  return task(ctx);
}

auto run_identity(const TaskFn &task, const JobContext &ctx) -> int { return task(ctx); }

} // namespace jobtree
