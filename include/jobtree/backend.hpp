#pragma once
#include "jobtree/job.hpp"

#include <functional>
#include <memory>
#include <string_view>

namespace jobtree {

// Result of a dispatched unit, awaited once.
class JobHandle {
public:
  virtual ~JobHandle() = default;
  virtual auto wait() -> JobReturn = 0;
};

using JobUnit = std::function<JobReturn()>;

// Where job units run. Backends that share a process must never switch the
// working directory; tasks find their root through JobContext instead.
class ExecutionBackend {
public:
  virtual ~ExecutionBackend() = default;

  virtual auto dispatch(JobUnit unit) -> std::unique_ptr<JobHandle> = 0;
  [[nodiscard]] virtual bool shares_process() const = 0;
  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

// One forked process per unit; the result comes back over a pipe.
class LocalProcessBackend final : public ExecutionBackend {
public:
  auto dispatch(JobUnit unit) -> std::unique_ptr<JobHandle> override;
  [[nodiscard]] bool shares_process() const override { return false; }
  [[nodiscard]] auto name() const -> std::string_view override { return "local"; }
};

// One thread per unit in the calling process.
class ThreadBackend final : public ExecutionBackend {
public:
  auto dispatch(JobUnit unit) -> std::unique_ptr<JobHandle> override;
  [[nodiscard]] bool shares_process() const override { return true; }
  [[nodiscard]] auto name() const -> std::string_view override { return "threads"; }
};

} // namespace jobtree
