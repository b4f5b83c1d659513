#include "ui/Screen.hpp"
#include <algorithm>

namespace svcdash::ui {

static constexpr const char* kSyncBegin = "\x1B[?2026h";
static constexpr const char* kSyncEnd = "\x1B[?2026l";

static void move_to_row(std::string& out, size_t row) {
  out += "\x1B[";
  out += std::to_string(row + 1);
  out += ";1H\x1B[K";
}

std::string Screen::paint(const std::vector<std::string>& lines) {
  std::string body;
  // After a resize the old content may sit outside the new row range
  if (full_clear_) body += "\x1B[2J";
  const size_t rows = std::max(lines.size(), prev_.size());
  for (size_t i = 0; i < rows; ++i) {
    if (i >= lines.size()) {
      move_to_row(body, i);
      continue;
    }
    if (i < prev_.size() && prev_[i] == lines[i]) continue;
    move_to_row(body, i);
    body += lines[i];
  }
  prev_ = lines;
  full_clear_ = false;
  if (body.empty()) return {};
  std::string out;
  out.reserve(body.size() + 24);
  out += kSyncBegin;
  out += body;
  out += "\x1B[0m";
  out += kSyncEnd;
  return out;
}

} // namespace svcdash::ui
