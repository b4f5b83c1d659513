#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace svcdash::app {

// Append-only event journal (actions, refresh failures, follower exits).
// record() stamps and queues the line; a background thread does the file
// I/O so the event loop never waits on disk.
class EventLog {
public:
  explicit EventLog(std::filesystem::path path,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(250));
  ~EventLog();
  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // Open the file and start the writer. Returns false (and disables the
  // log) when the file cannot be opened.
  bool start();
  // Write whatever is queued, then join.
  void stop();

  // Queue "<local time> <category>: <text>". No-op when disabled.
  void record(const char* category, const std::string& text);

  [[nodiscard]] bool enabled() const { return !path_.empty(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  void run(std::stop_token st);
  void write_pending();

  std::filesystem::path path_;
  std::ofstream file_;
  std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<std::string> pending_;
  std::jthread thread_;
};

// "YYYY-MM-DD HH:MM:SS.mmm" in local time.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace svcdash::app
