#include "app/LogTail.hpp"
#include "ui/Formatting.hpp"
#include <cerrno>
#include <unistd.h>

namespace svcdash::app {

using model::LogChannel;
using model::LogLine;
using model::LogState;

std::vector<std::string> LineFramer::feed(const char* data, size_t len) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t i = 0; i < len; ++i) {
    if (data[i] != '\n') continue;
    partial_.append(data + start, i - start);
    lines.push_back(ui::sanitize_text(partial_));
    partial_.clear();
    start = i + 1;
  }
  partial_.append(data + start, len - start);
  return lines;
}

std::optional<std::string> LineFramer::finish() {
  if (partial_.empty()) return std::nullopt;
  std::string line = ui::sanitize_text(partial_);
  partial_.clear();
  return line;
}

void LogTail::append(LogState& log, std::string text, LogChannel channel) {
  if (channel == LogChannel::Diagnostic) text = std::string(model::kDiagnosticMarker) + text;
  log.lines.push(LogLine{std::move(text), channel});
  // A reader scrolled back keeps looking at the same lines
  if (log.scroll > 0) log.scroll++;
}

void LogTail::start(const std::string& service, LogState& log) {
  stop();
  log.service = service;
  log.lines.clear();
  log.scroll = 0;
  child_ = backend_.follow_log(service);
  out_framer_ = LineFramer{};
  err_framer_ = LineFramer{};
  service_ = service;
  phase_ = Phase::Streaming;
}

void LogTail::stop() noexcept {
  child_.terminate();
  child_ = util::Child{};
  out_framer_ = LineFramer{};
  err_framer_ = LineFramer{};
  service_.clear();
  phase_ = Phase::Idle;
}

std::vector<int> LogTail::fds() const {
  std::vector<int> out;
  if (phase_ != Phase::Streaming) return out;
  if (child_.out_fd() >= 0) out.push_back(child_.out_fd());
  if (child_.err_fd() >= 0) out.push_back(child_.err_fd());
  return out;
}

bool LogTail::drain_fd(int fd, LineFramer& framer, LogChannel channel, LogState& log, bool& eof) {
  bool added = false;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      for (auto& line : framer.feed(buf, (size_t)n)) { append(log, std::move(line), channel); added = true; }
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
    // EOF or a hard error both end the stream
    if (auto tail = framer.finish()) { append(log, std::move(*tail), channel); added = true; }
    eof = true;
    break;
  }
  return added;
}

bool LogTail::drain(LogState& log) {
  if (phase_ != Phase::Streaming) return false;
  bool added = false;
  if (child_.out_fd() >= 0) {
    bool eof = false;
    added |= drain_fd(child_.out_fd(), out_framer_, LogChannel::Primary, log, eof);
    if (eof) child_.close_out();
  }
  if (child_.err_fd() >= 0) {
    bool eof = false;
    added |= drain_fd(child_.err_fd(), err_framer_, LogChannel::Diagnostic, log, eof);
    if (eof) child_.close_err();
  }
  return added;
}

std::optional<int> LogTail::reap(LogState& log) {
  if (phase_ != Phase::Streaming) return std::nullopt;
  if (child_.out_fd() >= 0 || child_.err_fd() >= 0) return std::nullopt;
  auto code = child_.try_wait();
  if (!code) return std::nullopt;
  append(log, "[exited: " + std::to_string(*code) + "]", LogChannel::Marker);
  child_ = util::Child{};
  service_.clear();
  phase_ = Phase::Idle;
  return code;
}

} // namespace svcdash::app
