#include "app/StateMachine.hpp"
#include "ui/Formatting.hpp"
#include "ui/Layout.hpp"
#include <algorithm>

namespace svcdash::app {

using model::AppState;
using model::ControlAction;
using model::Mode;
using model::Tone;
using ui::Key;
using ui::KeyEvent;

namespace {

void move_selection(AppState& s, int delta) {
  int n = (int)model::filtered_view(s).size();
  s.selection = std::clamp(s.selection + delta, 0, std::max(0, n - 1));
}

// Shared list navigation for Dashboard and Search. Returns true if handled.
bool navigate(AppState& s, const KeyEvent& ev, bool vi_keys) {
  const int page = ui::dashboard_rows(s.screen_rows);
  switch (ev.key) {
    case Key::Up:       move_selection(s, -1); return true;
    case Key::Down:     move_selection(s, +1); return true;
    case Key::PageUp:   move_selection(s, -page); return true;
    case Key::PageDown: move_selection(s, +page); return true;
    case Key::Home:     s.selection = 0; return true;
    case Key::End:      s.selection = std::max(0, (int)model::filtered_view(s).size() - 1); return true;
    default: break;
  }
  if (vi_keys && ev.is_char('k')) { move_selection(s, -1); return true; }
  if (vi_keys && ev.is_char('j')) { move_selection(s, +1); return true; }
  return false;
}

std::vector<Effect> on_dashboard(AppState& s, const KeyEvent& ev, const ApplyContext& ctx) {
  if (ev.key == Key::Escape) {
    if (!s.search_query.empty()) {
      s.search_query.clear();
      model::clamp_selection(s);
      return {};
    }
    return {Effect::quit()};
  }
  if (navigate(s, ev, true)) return {};
  if (ev.key != Key::Char || ev.text.size() != 1) return {};

  const char c = ev.text[0];
  switch (c) {
    case '/':
      model::enter_mode(s, Mode::Search);
      return {};
    case 'R':
      return {Effect::refresh(false)};
    case 'a':
      if (s.busy) return {};
      model::enter_mode(s, Mode::AddForm);
      s.add_form = model::AddFormState{};
      return {};
    case 'd': case 'l': case 's': case 'r': case 'e':
      break;
    default:
      return {};
  }

  if (s.busy && c != 'l') return {};
  auto svc = model::selected_service(s);
  if (!svc) {
    model::set_flash(s, Tone::Info, "No service selected", ctx.now, ctx.flash_ttl);
    return {};
  }
  switch (c) {
    case 'd':
      model::enter_mode(s, Mode::ConfirmRemove);
      s.confirm_target = svc->name;
      return {};
    case 'l':
      model::enter_mode(s, Mode::LogView);
      s.log = model::LogState{};
      s.log->service = svc->name;
      return {Effect::start_logs(svc->name)};
    case 's':
      return {Effect::control(svc->active ? ControlAction::Stop : ControlAction::Start, svc->name)};
    case 'r':
      return {Effect::control(ControlAction::Restart, svc->name)};
    case 'e':
      // Unknown enablement is treated as disabled
      return {Effect::control(svc->enabled.value_or(false) ? ControlAction::Disable : ControlAction::Enable, svc->name)};
  }
  return {};
}

std::vector<Effect> on_search(AppState& s, const KeyEvent& ev) {
  switch (ev.key) {
    case Key::Enter:
      model::enter_mode(s, Mode::Dashboard);
      model::clamp_selection(s);
      return {};
    case Key::Escape:
      s.search_query.clear();
      model::enter_mode(s, Mode::Dashboard);
      model::clamp_selection(s);
      return {};
    case Key::Backspace:
      ui::pop_codepoint(s.search_query);
      s.selection = 0;
      return {};
    case Key::Char:
      s.search_query += ev.text;
      s.selection = 0;
      return {};
    default:
      break;
  }
  navigate(s, ev, false);
  return {};
}

std::vector<Effect> on_add_form(AppState& s, const KeyEvent& ev, const ApplyContext& ctx) {
  if (!s.add_form) s.add_form = model::AddFormState{};
  auto& f = *s.add_form;
  std::string& field = f.focus == 0 ? f.name : f.command;
  switch (ev.key) {
    case Key::Escape:
      model::enter_mode(s, Mode::Dashboard);
      model::set_flash(s, Tone::Info, "Canceled", ctx.now, ctx.flash_ttl);
      return {};
    case Key::Tab: case Key::Up: case Key::Down:
      f.focus = f.focus == 0 ? 1 : 0;
      return {};
    case Key::Backspace:
      ui::pop_codepoint(field);
      return {};
    case Key::Char:
      field += ev.text;
      return {};
    case Key::Enter: {
      if (f.focus == 0) { f.focus = 1; return {}; }
      if (s.busy) return {};
      std::string name = ui::trim(f.name);
      std::string command = ui::trim(f.command);
      if (name.empty() || command.empty()) {
        model::set_flash(s, Tone::Error, "Name and command required", ctx.now, ctx.flash_ttl);
        return {};
      }
      return {Effect::create(model::CreateRequest{std::move(name), std::move(command), ctx.cwd})};
    }
    default:
      return {};
  }
}

std::vector<Effect> on_confirm_remove(AppState& s, const KeyEvent& ev, const ApplyContext& ctx) {
  std::string target = s.confirm_target.value_or("");
  model::enter_mode(s, Mode::Dashboard);
  if ((ev.is_char('y') || ev.is_char('Y')) && !target.empty()) return {Effect::remove(std::move(target))};
  model::set_flash(s, Tone::Info, "Remove canceled", ctx.now, ctx.flash_ttl);
  return {};
}

std::vector<Effect> on_log_view(AppState& s, const KeyEvent& ev, const ApplyContext& ctx) {
  if (ev.key == Key::Escape) {
    model::enter_mode(s, Mode::Dashboard);
    model::set_flash(s, Tone::Info, "Returned to dashboard", ctx.now, ctx.flash_ttl);
    return {Effect::stop_logs()};
  }
  if (!s.log) return {};
  const int viewport = ui::log_rows(s.screen_rows);
  const int total = (int)s.log->lines.size();
  int& scroll = s.log->scroll;
  switch (ev.key) {
    case Key::Up:       scroll += 1; break;
    case Key::Down:     scroll -= 1; break;
    case Key::PageUp:   scroll += viewport; break;
    case Key::PageDown: scroll -= viewport; break;
    case Key::Home:     scroll = total; break;
    case Key::End:      scroll = 0; break;
    default: return {};
  }
  scroll = model::clamp_scroll(scroll, total, viewport);
  return {};
}

} // namespace

std::vector<Effect> apply(AppState& s, const KeyEvent& ev, const ApplyContext& ctx) {
  if (ev.key == Key::Interrupt) return {Effect::quit()};
  switch (s.mode) {
    case Mode::Dashboard:     return on_dashboard(s, ev, ctx);
    case Mode::Search:        return on_search(s, ev);
    case Mode::AddForm:       return on_add_form(s, ev, ctx);
    case Mode::ConfirmRemove: return on_confirm_remove(s, ev, ctx);
    case Mode::LogView:       return on_log_view(s, ev, ctx);
  }
  return {};
}

} // namespace svcdash::app
