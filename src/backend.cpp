#include "jobtree/backend.hpp"

#include "jobtree/log.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <future>
#include <iostream>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace jobtree {

namespace {

constexpr std::string_view kForeignException = "job unit threw a non-standard exception";

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      reset(other.fd_);
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != -1 && fd_ != fd) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_{-1};
};

auto failed(std::string error) -> JobReturn {
  JobReturn r{};
  r.status = JobStatus::Failed;
  r.error = std::move(error);
  return r;
}

void write_all(int fd, const std::string &data) {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "write");
    }
    off += static_cast<std::size_t>(n);
  }
}

auto read_all(int fd) -> std::string {
  std::string out;
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n == 0) {
      return out;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "read");
    }
    out.append(buf.data(), static_cast<std::size_t>(n));
  }
}

// Child side: run the unit, ship the result, never return.
[[noreturn]] void run_child(const JobUnit &unit, UniqueFd out) {
  int code = 0;
  try {
    JobReturn ret;
    try {
      ret = unit();
    } catch (const std::exception &e) {
      ret = failed(e.what());
    } catch (...) {
      ret = failed(std::string(kForeignException));
    }
    write_all(out.get(), encode(ret));
  } catch (const std::exception &e) {
    std::cerr << "jobtree: job process " << ::getpid() << ": " << e.what() << '\n';
    code = 1;
  }
  out.reset();
  std::cout.flush();
  std::cerr.flush();
  std::fflush(nullptr);
  ::_exit(code);
}

class ProcessHandle final : public JobHandle {
public:
  ProcessHandle(pid_t pid, UniqueFd in) : pid_{pid}, in_{std::move(in)} {}

  auto wait() -> JobReturn override {
    std::string wire;
    std::string read_error;
    try {
      wire = read_all(in_.get());
    } catch (const std::system_error &e) {
      read_error = e.what();
    }
    in_.reset();

    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
      if (errno != EINTR) {
        return failed("waitpid " + std::to_string(pid_) + ": " +
                      std::system_category().message(errno));
      }
    }
    if (!read_error.empty()) {
      return failed("job process " + std::to_string(pid_) + ": " + read_error);
    }
    if (wire.empty()) {
      std::string why = WIFSIGNALED(status)
                            ? "killed by signal " + std::to_string(WTERMSIG(status))
                            : "exited with status " + std::to_string(WEXITSTATUS(status));
      return failed("job process " + std::to_string(pid_) + " " + why + " without a result");
    }
    try {
      return decode_job_return(wire);
    } catch (const std::exception &e) {
      return failed("job process " + std::to_string(pid_) + ": " + e.what());
    }
  }

private:
  pid_t pid_;
  UniqueFd in_;
};

class ThreadHandle final : public JobHandle {
public:
  explicit ThreadHandle(std::future<JobReturn> fut) : fut_{std::move(fut)} {}

  auto wait() -> JobReturn override {
    try {
      return fut_.get();
    } catch (const std::exception &e) {
      return failed(e.what());
    } catch (...) {
      return failed(std::string(kForeignException));
    }
  }

private:
  std::future<JobReturn> fut_;
};

} // namespace

auto LocalProcessBackend::dispatch(JobUnit unit) -> std::unique_ptr<JobHandle> {
  std::array<int, 2> fds{};
  if (::pipe(fds.data()) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  UniqueFd rd{fds[0]};
  UniqueFd wr{fds[1]};

  // Buffered output would otherwise be written twice.
  std::cout.flush();
  std::cerr.flush();
  std::clog.flush();
  std::fflush(nullptr);

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    rd.reset();
    run_child(unit, std::move(wr));
  }
  log::debug(log::tag::kLaunch, "dispatched job process ", pid);
  return std::make_unique<ProcessHandle>(pid, std::move(rd));
}

auto ThreadBackend::dispatch(JobUnit unit) -> std::unique_ptr<JobHandle> {
  return std::make_unique<ThreadHandle>(std::async(std::launch::async, std::move(unit)));
}

} // namespace jobtree
