#include "app/EventLog.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace svcdash::app {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, (int)ms);
  return buf;
}

EventLog::EventLog(std::filesystem::path path, std::chrono::milliseconds interval)
    : path_(std::move(path)), interval_(interval) {
  if (path_.empty() || !path_.has_parent_path()) return;
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    std::fprintf(stderr, "svcdash: event log: failed to create %s: %s\n",
                 path_.parent_path().c_str(), ec.message().c_str());
  }
}

EventLog::~EventLog() { stop(); }

bool EventLog::start() {
  if (!enabled()) return false;
  file_.open(path_, std::ios::app);
  if (!file_) {
    std::fprintf(stderr, "svcdash: event log: failed to open %s: %s\n",
                 path_.c_str(), std::strerror(errno));
    path_.clear();
    return false;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void EventLog::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
  }
  if (file_.is_open()) {
    write_pending();
    file_.close();
  }
}

void EventLog::record(const char* category, const std::string& text) {
  if (!enabled()) return;
  std::string line = format_timestamp(std::chrono::system_clock::now());
  line += ' ';
  line += category;
  line += ": ";
  line += text;
  line += '\n';
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.push_back(std::move(line));
  }
  cv_.notify_one();
}

void EventLog::run(std::stop_token st) {
  while (!st.stop_requested()) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait_for(lk, st, interval_, [this]{ return !pending_.empty(); });
    }
    write_pending();
  }
}

void EventLog::write_pending() {
  std::deque<std::string> batch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    batch.swap(pending_);
  }
  if (batch.empty()) return;
  for (const auto& line : batch) file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  file_.flush();
}

} // namespace svcdash::app
