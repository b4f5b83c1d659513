#pragma once

#include "app/Backend.hpp"
#include "model/AppState.hpp"
#include "util/Subprocess.hpp"
#include <optional>
#include <string>
#include <vector>

namespace svcdash::app {

// Splits a byte stream into lines scrubbed by ui::sanitize_text. A
// trailing partial line is
// held until its newline arrives or finish() is called.
class LineFramer {
public:
  std::vector<std::string> feed(const char* data, size_t len);
  std::optional<std::string> finish();
  [[nodiscard]] bool has_partial() const { return !partial_.empty(); }

private:
  std::string partial_;
};

// Owns at most one log follower process and feeds its output into a
// LogState. All calls happen on the event loop thread.
class LogTail {
public:
  enum class Phase { Idle, Streaming };

  explicit LogTail(IServiceBackend& backend) : backend_(backend) {}
  ~LogTail() { stop(); }
  LogTail(const LogTail&) = delete;
  LogTail& operator=(const LogTail&) = delete;

  // Replace any running follower with one for `service`; clears `log`.
  // Throws std::system_error when the follower cannot be spawned.
  void start(const std::string& service, model::LogState& log);

  // Kill and reap the follower. Safe from Idle.
  void stop() noexcept;

  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] const std::string& service() const { return service_; }

  // Pipe fds still open, for the event loop's poll set.
  [[nodiscard]] std::vector<int> fds() const;

  // Read everything currently available from both pipes into `log`.
  // Returns true when any line was appended.
  bool drain(model::LogState& log);

  // Once both pipes hit EOF, reap the follower, append the exit marker and
  // return to Idle. Returns the exit code the one time that happens.
  std::optional<int> reap(model::LogState& log);

private:
  bool drain_fd(int fd, LineFramer& framer, model::LogChannel channel, model::LogState& log, bool& eof);
  static void append(model::LogState& log, std::string text, model::LogChannel channel);

  IServiceBackend& backend_;
  util::Child child_;
  LineFramer out_framer_;
  LineFramer err_framer_;
  std::string service_;
  Phase phase_{Phase::Idle};
};

} // namespace svcdash::app
