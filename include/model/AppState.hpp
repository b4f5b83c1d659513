#pragma once

#include "model/Service.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace svcdash::model {

using Clock = std::chrono::steady_clock;

enum class Mode { Dashboard, Search, AddForm, ConfirmRemove, LogView };
enum class Tone { Success, Error, Info };

struct Flash {
  Tone tone{Tone::Info};
  std::string text;
  Clock::time_point expires{};
};

struct AddFormState {
  std::string name;
  std::string command;
  int focus{0};  // 0 = name, 1 = command
};

enum class LogChannel { Primary, Diagnostic, Marker };

struct LogLine {
  std::string text;
  LogChannel channel{LogChannel::Primary};
};

inline constexpr std::size_t kLogCapacity = 250;
inline constexpr const char* kDiagnosticMarker = "[err] ";

// Bounded line buffer; pushing past capacity evicts the oldest line.
class LogLines {
public:
  LogLines() = default;
  explicit LogLines(std::size_t cap) : cap_(cap) {}

  void push(LogLine line) {
    lines_.push_back(std::move(line));
    while (lines_.size() > cap_) lines_.pop_front();
  }
  void clear() { lines_.clear(); }

  [[nodiscard]] std::size_t size() const { return lines_.size(); }
  [[nodiscard]] bool empty() const { return lines_.empty(); }
  [[nodiscard]] std::size_t capacity() const { return cap_; }
  [[nodiscard]] const LogLine& operator[](std::size_t i) const { return lines_[i]; }
  [[nodiscard]] const LogLine& back() const { return lines_.back(); }

private:
  std::size_t cap_{kLogCapacity};
  std::deque<LogLine> lines_;
};

struct LogState {
  std::string service;
  LogLines lines;
  int scroll{0};  // lines back from the live tail
};

struct AppState {
  std::vector<ServiceEntry> services;
  int selection{0};
  Mode mode{Mode::Dashboard};
  std::string search_query;
  bool busy{false};
  std::optional<Flash> flash;
  std::optional<std::string> confirm_target;
  std::optional<AddFormState> add_form;
  std::optional<LogState> log;
  int spinner_frame{0};
  int screen_rows{24};
};

// Indices into state.services that pass the search filter, in list order.
[[nodiscard]] std::vector<std::size_t> filtered_view(const AppState& s);

// Currently selected record, if the filtered view is non-empty.
[[nodiscard]] std::optional<ServiceRecord> selected_service(const AppState& s);

// Clamp selection into [0, max(1, len(view))).
void clamp_selection(AppState& s);

// Clamp scroll into [0, max(0, total - viewport)].
[[nodiscard]] int clamp_scroll(int scroll, int total, int viewport);

// Switch mode, dropping the sub-state of every other mode.
void enter_mode(AppState& s, Mode m);

void set_flash(AppState& s, Tone tone, std::string text, Clock::time_point now,
               std::chrono::milliseconds ttl);

// Drop the flash if it has expired; returns true if it was removed.
bool expire_flash(AppState& s, Clock::time_point now);

} // namespace svcdash::model
