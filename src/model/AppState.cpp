#include "model/AppState.hpp"
#include <algorithm>
#include <cctype>

namespace svcdash::model {

static std::string lower_copy(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::size_t> filtered_view(const AppState& s) {
  std::vector<std::size_t> out;
  out.reserve(s.services.size());
  const std::string needle = lower_copy(s.search_query);
  for (std::size_t i = 0; i < s.services.size(); ++i) {
    const auto& e = s.services[i];
    if (e.hidden()) continue;
    if (!needle.empty() && lower_copy(e.confirmed.name).find(needle) == std::string::npos) continue;
    out.push_back(i);
  }
  return out;
}

std::optional<ServiceRecord> selected_service(const AppState& s) {
  auto view = filtered_view(s);
  if (view.empty() || s.selection < 0 || s.selection >= (int)view.size()) return std::nullopt;
  return s.services[view[(size_t)s.selection]].view();
}

void clamp_selection(AppState& s) {
  int n = (int)filtered_view(s).size();
  s.selection = std::clamp(s.selection, 0, std::max(0, n - 1));
}

int clamp_scroll(int scroll, int total, int viewport) {
  return std::clamp(scroll, 0, std::max(0, total - viewport));
}

void enter_mode(AppState& s, Mode m) {
  s.mode = m;
  if (m != Mode::ConfirmRemove) s.confirm_target.reset();
  if (m != Mode::AddForm) s.add_form.reset();
  if (m != Mode::LogView) s.log.reset();
}

void set_flash(AppState& s, Tone tone, std::string text, Clock::time_point now,
               std::chrono::milliseconds ttl) {
  s.flash = Flash{tone, std::move(text), now + ttl};
}

bool expire_flash(AppState& s, Clock::time_point now) {
  if (s.flash && now >= s.flash->expires) {
    s.flash.reset();
    return true;
  }
  return false;
}

} // namespace svcdash::model
