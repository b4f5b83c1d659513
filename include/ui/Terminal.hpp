#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>

namespace svcdash::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_resized;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_stop_signal(int);
void on_winch(int);
void on_atexit_restore();
void install_signal_handlers();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool tty_stdin();
[[nodiscard]] bool truecolor_capable();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// SGR code generation (empty when stdout is not a terminal)
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);
// Write everything, waiting out EAGAIN; returns false on a hard error.
bool write_all(int fd, const std::string& data);

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
  [[nodiscard]] bool active() const { return active_; }
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

} // namespace svcdash::ui
