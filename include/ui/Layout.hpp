#pragma once

#include <algorithm>

namespace svcdash::ui {

// Rows reserved for header/footer chrome in each layout.
inline constexpr int kDashboardChrome = 5;  // title, search/blank, column header, status, footer
inline constexpr int kLogChrome = 4;        // title, blank, status, footer
inline constexpr int kPadX = 2;

inline constexpr int kMinCols = 2;
inline constexpr int kMinRows = 3;

[[nodiscard]] inline int dashboard_rows(int height) { return std::max(1, height - kDashboardChrome); }
[[nodiscard]] inline int log_rows(int height) { return std::max(1, height - kLogChrome); }

struct WindowRange {
  int start{0};
  int end{0};
};

// Visible slice of `total` items keeping `sel` in view: centred on the
// selection, clamped at both edges.
[[nodiscard]] inline WindowRange window_range(int total, int sel, int win) {
  if (total <= 0) return {0, 0};
  if (win <= 0) return {0, 0};
  if (total <= win) return {0, total};
  int start = std::clamp(sel - win / 2, 0, total - win);
  return {start, std::min(total, start + win)};
}

} // namespace svcdash::ui
