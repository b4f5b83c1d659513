#include "minitest.hpp"
#include "app/StateMachine.hpp"
#include <string>
#include <vector>

using namespace svcdash;
using app::ApplyContext;
using app::Effect;
using model::AppState;
using model::Mode;
using model::Tone;
using ui::Key;
using ui::KeyEvent;

static KeyEvent ch(char c) { return KeyEvent{Key::Char, std::string(1, c)}; }
static KeyEvent key(Key k) { return KeyEvent{k, {}}; }

static ApplyContext ctx() {
  ApplyContext c;
  c.now = model::Clock::now();
  c.cwd = "/srv/app";
  return c;
}

static AppState with_services(std::initializer_list<const char*> names) {
  AppState s;
  for (const char* n : names) {
    model::ServiceEntry e;
    e.confirmed.name = n;
    e.confirmed.status = "inactive (dead)";
    s.services.push_back(e);
  }
  return s;
}

static std::vector<std::string> visible_names(const AppState& s) {
  std::vector<std::string> out;
  for (auto i : model::filtered_view(s)) out.push_back(s.services[i].confirmed.name);
  return out;
}

static std::vector<Effect> type(AppState& s, const std::string& text) {
  std::vector<Effect> all;
  for (char c : text) {
    auto e = app::apply(s, ch(c), ctx());
    all.insert(all.end(), e.begin(), e.end());
  }
  return all;
}

TEST(search_filter_keeps_order_case_insensitive) {
  auto s = with_services({"web-api", "worker", "WebHook"});
  ASSERT_TRUE(app::apply(s, ch('/'), ctx()).empty());
  ASSERT_EQ(s.mode, Mode::Search);
  type(s, "web");
  ASSERT_EQ(visible_names(s), (std::vector<std::string>{"web-api", "WebHook"}));
  ASSERT_EQ(s.selection, 0);
}

TEST(search_enter_commits_escape_clears) {
  auto s = with_services({"web-api", "worker", "webhook"});
  app::apply(s, ch('/'), ctx());
  type(s, "wor");
  app::apply(s, key(Key::Enter), ctx());
  ASSERT_EQ(s.mode, Mode::Dashboard);
  ASSERT_EQ(s.search_query, "wor");
  ASSERT_EQ(visible_names(s), std::vector<std::string>{"worker"});

  // Escape on the dashboard clears the filter before it would quit
  auto eff = app::apply(s, key(Key::Escape), ctx());
  ASSERT_TRUE(eff.empty());
  ASSERT_TRUE(s.search_query.empty());
  eff = app::apply(s, key(Key::Escape), ctx());
  ASSERT_EQ(eff.size(), 1u);
  ASSERT_EQ(eff[0].kind, Effect::Kind::Quit);

  app::apply(s, ch('/'), ctx());
  type(s, "hook");
  app::apply(s, key(Key::Escape), ctx());
  ASSERT_EQ(s.mode, Mode::Dashboard);
  ASSERT_TRUE(s.search_query.empty());
}

TEST(search_backspace_and_navigation) {
  auto s = with_services({"web-a", "web-b", "web-c", "db"});
  app::apply(s, ch('/'), ctx());
  type(s, "webx");
  ASSERT_TRUE(visible_names(s).empty());
  app::apply(s, key(Key::Backspace), ctx());
  ASSERT_EQ(s.search_query, "web");
  app::apply(s, key(Key::Down), ctx());
  app::apply(s, key(Key::Down), ctx());
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.selection, 2);
  // j is text while searching
  type(s, "j");
  ASSERT_EQ(s.search_query, "webj");
  ASSERT_EQ(s.selection, 0);
}

TEST(dashboard_movement_keys) {
  auto s = with_services({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j"});
  s.screen_rows = 9;  // four list rows per page
  app::apply(s, ch('j'), ctx());
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.selection, 2);
  app::apply(s, ch('k'), ctx());
  ASSERT_EQ(s.selection, 1);
  app::apply(s, key(Key::PageDown), ctx());
  ASSERT_EQ(s.selection, 5);
  app::apply(s, key(Key::End), ctx());
  ASSERT_EQ(s.selection, 9);
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.selection, 9);
  app::apply(s, key(Key::PageUp), ctx());
  ASSERT_EQ(s.selection, 5);
  app::apply(s, key(Key::Home), ctx());
  ASSERT_EQ(s.selection, 0);
  app::apply(s, key(Key::Up), ctx());
  ASSERT_EQ(s.selection, 0);
}

TEST(dashboard_toggle_follows_active) {
  auto s = with_services({"svc1"});
  auto eff = app::apply(s, ch('s'), ctx());
  ASSERT_EQ(eff.size(), 1u);
  ASSERT_EQ(eff[0].kind, Effect::Kind::Control);
  ASSERT_EQ(eff[0].action, model::ControlAction::Start);
  ASSERT_EQ(eff[0].name, "svc1");

  s.services[0].confirmed.active = true;
  eff = app::apply(s, ch('s'), ctx());
  ASSERT_EQ(eff[0].action, model::ControlAction::Stop);
  eff = app::apply(s, ch('r'), ctx());
  ASSERT_EQ(eff[0].action, model::ControlAction::Restart);
  eff = app::apply(s, ch('e'), ctx());
  ASSERT_EQ(eff[0].action, model::ControlAction::Enable);
  s.services[0].confirmed.enabled = true;
  eff = app::apply(s, ch('e'), ctx());
  ASSERT_EQ(eff[0].action, model::ControlAction::Disable);
  eff = app::apply(s, ch('R'), ctx());
  ASSERT_EQ(eff[0].kind, Effect::Kind::Refresh);
  ASSERT_FALSE(eff[0].silent);
}

TEST(dashboard_no_selection_info) {
  AppState s;
  for (char c : std::string("srld")) {
    s.flash.reset();
    auto eff = app::apply(s, ch(c), ctx());
    ASSERT_TRUE(eff.empty());
    ASSERT_TRUE(s.flash.has_value());
    ASSERT_EQ(s.flash->tone, Tone::Info);
    ASSERT_EQ(s.flash->text, "No service selected");
    ASSERT_EQ(s.mode, Mode::Dashboard);
  }
}

TEST(dashboard_busy_suppresses_actions) {
  auto s = with_services({"svc1", "svc2"});
  s.busy = true;
  for (char c : std::string("sreda")) {
    ASSERT_TRUE(app::apply(s, ch(c), ctx()).empty());
    ASSERT_EQ(s.mode, Mode::Dashboard);
  }
  // Navigation still works
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.selection, 1);
}

TEST(add_form_requires_command) {
  auto s = with_services({"svc1"});
  app::apply(s, ch('a'), ctx());
  ASSERT_EQ(s.mode, Mode::AddForm);
  type(s, "my-app");
  app::apply(s, key(Key::Enter), ctx());
  ASSERT_EQ(s.add_form->focus, 1);
  type(s, "   ");
  auto eff = app::apply(s, key(Key::Enter), ctx());
  ASSERT_TRUE(eff.empty());
  ASSERT_EQ(s.mode, Mode::AddForm);
  ASSERT_TRUE(s.flash.has_value());
  ASSERT_EQ(s.flash->tone, Tone::Error);
  ASSERT_EQ(s.flash->text, "Name and command required");
  ASSERT_EQ(s.add_form->name, "my-app");
}

TEST(add_form_submit_creates_request) {
  AppState s;
  app::apply(s, ch('a'), ctx());
  type(s, " my-app ");
  app::apply(s, key(Key::Tab), ctx());
  type(s, "/usr/bin/myapp --port 3000");
  app::apply(s, key(Key::Backspace), ctx());
  type(s, "1");
  auto eff = app::apply(s, key(Key::Enter), ctx());
  ASSERT_EQ(eff.size(), 1u);
  ASSERT_EQ(eff[0].kind, Effect::Kind::Create);
  ASSERT_EQ(eff[0].request.name, "my-app");
  ASSERT_EQ(eff[0].request.command, "/usr/bin/myapp --port 3001");
  ASSERT_EQ(eff[0].request.working_directory, "/srv/app");
  // The form stays until the backend confirms
  ASSERT_EQ(s.mode, Mode::AddForm);

  s.busy = true;
  ASSERT_TRUE(app::apply(s, key(Key::Enter), ctx()).empty());
}

TEST(add_form_focus_toggle_and_cancel) {
  AppState s;
  app::apply(s, ch('a'), ctx());
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.add_form->focus, 1);
  app::apply(s, key(Key::Up), ctx());
  ASSERT_EQ(s.add_form->focus, 0);
  type(s, "x");
  app::apply(s, key(Key::Escape), ctx());
  ASSERT_EQ(s.mode, Mode::Dashboard);
  ASSERT_FALSE(s.add_form.has_value());
  ASSERT_EQ(s.flash->text, "Canceled");
  ASSERT_EQ(s.flash->tone, Tone::Info);
}

TEST(confirm_remove_cancel_on_other_key) {
  for (KeyEvent ev : {ch('n'), ch('q'), key(Key::Enter), key(Key::Escape), key(Key::Down)}) {
    auto s = with_services({"svc1", "svc2"});
    app::apply(s, ch('d'), ctx());
    ASSERT_EQ(s.mode, Mode::ConfirmRemove);
    ASSERT_EQ(*s.confirm_target, "svc1");
    auto eff = app::apply(s, ev, ctx());
    ASSERT_TRUE(eff.empty());
    ASSERT_EQ(s.mode, Mode::Dashboard);
    ASSERT_FALSE(s.confirm_target.has_value());
    ASSERT_EQ(s.flash->text, "Remove canceled");
  }
}

TEST(confirm_remove_yes_dispatches) {
  for (char y : {'y', 'Y'}) {
    auto s = with_services({"svc1", "svc2"});
    app::apply(s, key(Key::Down), ctx());
    app::apply(s, ch('d'), ctx());
    auto eff = app::apply(s, ch(y), ctx());
    ASSERT_EQ(eff.size(), 1u);
    ASSERT_EQ(eff[0].kind, Effect::Kind::Remove);
    ASSERT_EQ(eff[0].name, "svc2");
    ASSERT_EQ(s.mode, Mode::Dashboard);
  }
}

TEST(log_view_enter_scroll_and_leave) {
  auto s = with_services({"svc1"});
  s.screen_rows = 14;  // ten log rows
  auto eff = app::apply(s, ch('l'), ctx());
  ASSERT_EQ(eff.size(), 1u);
  ASSERT_EQ(eff[0].kind, Effect::Kind::StartLogs);
  ASSERT_EQ(s.mode, Mode::LogView);
  ASSERT_EQ(s.log->service, "svc1");

  for (int i = 0; i < 35; ++i) s.log->lines.push({"l" + std::to_string(i), model::LogChannel::Primary});
  app::apply(s, key(Key::Up), ctx());
  ASSERT_EQ(s.log->scroll, 1);
  app::apply(s, key(Key::PageUp), ctx());
  ASSERT_EQ(s.log->scroll, 11);
  app::apply(s, key(Key::PageUp), ctx());
  app::apply(s, key(Key::PageUp), ctx());
  ASSERT_EQ(s.log->scroll, 25);  // clamped to total - viewport
  app::apply(s, key(Key::End), ctx());
  ASSERT_EQ(s.log->scroll, 0);
  app::apply(s, key(Key::Down), ctx());
  ASSERT_EQ(s.log->scroll, 0);
  app::apply(s, key(Key::Home), ctx());
  ASSERT_EQ(s.log->scroll, 25);

  eff = app::apply(s, key(Key::Escape), ctx());
  ASSERT_EQ(eff.size(), 1u);
  ASSERT_EQ(eff[0].kind, Effect::Kind::StopLogs);
  ASSERT_EQ(s.mode, Mode::Dashboard);
  ASSERT_FALSE(s.log.has_value());
  ASSERT_EQ(s.flash->text, "Returned to dashboard");
}

TEST(log_view_scroll_with_few_lines) {
  auto s = with_services({"svc1"});
  app::apply(s, ch('l'), ctx());
  app::apply(s, key(Key::PageUp), ctx());
  ASSERT_EQ(s.log->scroll, 0);
}

TEST(interrupt_quits_from_every_mode) {
  for (Mode m : {Mode::Dashboard, Mode::Search, Mode::AddForm, Mode::ConfirmRemove, Mode::LogView}) {
    auto s = with_services({"svc1"});
    model::enter_mode(s, m);
    auto eff = app::apply(s, key(Key::Interrupt), ctx());
    ASSERT_EQ(eff.size(), 1u);
    ASSERT_EQ(eff[0].kind, Effect::Kind::Quit);
  }
}

TEST(mode_switch_clears_other_substates) {
  auto s = with_services({"svc1"});
  app::apply(s, ch('l'), ctx());
  ASSERT_TRUE(s.log.has_value());
  s.search_query = "svc";
  model::enter_mode(s, Mode::AddForm);
  ASSERT_FALSE(s.log.has_value());
  ASSERT_FALSE(s.confirm_target.has_value());
  ASSERT_EQ(s.search_query, "svc");
  ASSERT_EQ(s.services.size(), 1u);
}
