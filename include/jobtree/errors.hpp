#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace jobtree {

// Root of the snapshot/isolation error taxonomy. Lower layers (object store,
// refs, index) throw plain std::runtime_error; the core wraps those at its
// component boundaries.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Batch level: no store marker between the start directory and "/".
class NotAVersionedTree : public Error {
public:
  explicit NotAVersionedTree(const std::filesystem::path &start)
      : Error("not a jobtree repository (or any parent up to /): " + start.string()),
        start_(start) {}

  [[nodiscard]] auto start() const -> const std::filesystem::path & { return start_; }

private:
  std::filesystem::path start_;
};

// Batch level.
class SnapshotCreationFailure : public Error {
public:
  using Error::Error;
};

// Job level; the affected job may fall back to the live tree.
class IsolationFailure : public Error {
public:
  using Error::Error;
};

class WorktreeCreationFailure : public IsolationFailure {
public:
  using IsolationFailure::IsolationFailure;
};

class SymlinkConflict : public IsolationFailure {
public:
  using IsolationFailure::IsolationFailure;
};

// Always logged and swallowed by callers.
class PushFailure : public Error {
public:
  using Error::Error;
};

// Always logged and swallowed; never changes a job's outcome.
class CleanupFailure : public Error {
public:
  using Error::Error;
};

} // namespace jobtree
