#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace svcdash::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_resized{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

bool write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n > 0) { off += (size_t)n; continue; }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd{.fd=fd,.events=POLLOUT,.revents=0};
      (void)::poll(&pfd, 1, 100);
      continue;
    }
    return false;
  }
  return true;
}

void restore_terminal_minimal() {
  // Async-signal-safe restoration: end any open sync bracket, leave alt screen, show cursor, reset SGR
  const char* sync_off = "\x1B[?2026l";
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  best_effort_write(STDOUT_FILENO, sync_off, std::char_traits<char>::length(sync_off));
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

// The event loop notices g_stop within one poll interval and unwinds the guards.
void on_stop_signal(int){ g_stop.store(true); }

void on_winch(int){ g_resized.store(true); }

void on_atexit_restore(){
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    tcdrain(STDOUT_FILENO);
  }
}

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  ::sigaction(SIGHUP, &sa, nullptr);
  struct sigaction sw{};
  sw.sa_handler = on_winch;
  sigemptyset(&sw.sa_mask);
  ::sigaction(SIGWINCH, &sw, nullptr);
  // A follower whose reader went away must not kill us
  std::signal(SIGPIPE, SIG_IGN);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool tty_stdin() {
  return ::isatty(STDIN_FILENO) == 1;
}

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (ct) {
    std::string s = ct;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos) return true;
  }
  return false;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    try { return std::max(20, std::stoi(c)); } catch (const std::exception&) {}
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  const char* env = std::getenv("LINES");
  if (env) { int r = std::atoi(env); if (r > 0) return r; }
  return 24;
}

static std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() {
  if (!tty_stdout()) return {};
  return std::string("\x1B[0m");
}

std::string sgr_bold() { return sgr("1"); }

static std::string sgr_code_int(int code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + std::to_string(code) + "m";
}

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  if (idx < 0) idx = 0;
  if (idx <= 7) return sgr_code_int(30 + idx);
  if (idx <= 15) return sgr_code_int(90 + (idx - 8));
  // 256-color fallback
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

// RAII guards for terminal state
RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      // ISIG off so Ctrl+C arrives as byte 0x03; ICRNL off so Enter arrives as CR
      neo.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
      neo.c_iflag &= ~(IXON | ICRNL);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) == 0) {
        old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
        active_ = true;
      }
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h\x1B[2J\x1B[H", 15);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[0m\x1B[?1049l", 12);
    g_alt_in_use.store(false);
  }
}

} // namespace svcdash::ui
