#pragma once

#include <string>
#include <vector>

namespace svcdash::ui {

// Line-diff painter. Keeps the last painted frame and emits only the rows
// that changed, wrapped in a synchronized-update bracket (CSI ?2026).
class Screen {
public:
  // Bytes that turn the previous frame into `lines`; empty when nothing changed.
  [[nodiscard]] std::string paint(const std::vector<std::string>& lines);

  // Forget the previous frame so the next paint redraws every row.
  void invalidate() { prev_.clear(); full_clear_ = true; }

  [[nodiscard]] const std::vector<std::string>& previous() const { return prev_; }

private:
  std::vector<std::string> prev_;
  bool full_clear_{false};
};

} // namespace svcdash::ui
