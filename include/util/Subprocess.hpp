#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace svcdash::util {

struct ExecResult {
  int code{-1};
  std::string out;
  std::string err;
};

// Run argv to completion with stdin on /dev/null, capturing both streams
// (trailing whitespace trimmed). Throws std::system_error when the program
// cannot be started.
ExecResult run_capture(const std::vector<std::string>& argv);

// Owning handle to a spawned process whose stdout/stderr are non-blocking
// pipes. Destruction terminates and reaps the process.
class Child {
public:
  Child() = default;
  Child(pid_t pid, int out_fd, int err_fd) : pid_(pid), out_fd_(out_fd), err_fd_(err_fd) {}
  ~Child();
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;
  Child(Child&& o) noexcept;
  Child& operator=(Child&& o) noexcept;

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] int out_fd() const { return out_fd_; }
  [[nodiscard]] int err_fd() const { return err_fd_; }
  [[nodiscard]] bool valid() const { return pid_ > 0; }

  void close_out();
  void close_err();

  // Non-blocking reap. Returns the exit code once (128+signal when killed).
  std::optional<int> try_wait();

  // SIGTERM, then SIGKILL after `grace`, then reap and close pipes. Never throws.
  void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(200));

private:
  void release();
  pid_t pid_{-1};
  int out_fd_{-1};
  int err_fd_{-1};
};

// Start argv with stdin on /dev/null and both output streams piped back.
// Throws std::system_error when the program cannot be started.
Child spawn_piped(const std::vector<std::string>& argv);

// Exit code from a waitpid() status word.
int decode_wait_status(int status);

} // namespace svcdash::util
