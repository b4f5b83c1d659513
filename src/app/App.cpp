#include "app/App.hpp"
#include "app/Actions.hpp"
#include "ui/Layout.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cerrno>
#include <exception>
#include <filesystem>
#include <poll.h>
#include <unistd.h>

using namespace std::chrono;

namespace svcdash::app {

using model::Clock;
using model::Mode;
using model::Tone;

// Bytes of an unfinished escape sequence are resolved after this pause
static constexpr milliseconds kInputPendingTimeout{50};
// Reap cadence once both follower pipes hit EOF
static constexpr milliseconds kReapTick{100};

App::App(ui::Config cfg, std::unique_ptr<IServiceBackend> backend, EventLog& events)
    : cfg_(std::move(cfg)), backend_(std::move(backend)), events_(events),
      tail_(*backend_), refresh_(milliseconds(cfg_.timing.refresh_ms)) {
  std::error_code ec;
  cwd_ = std::filesystem::current_path(ec).string();
  render_ctx_.theme = cfg_.theme;
  render_ctx_.title = cfg_.ui.title;
  render_ctx_.platform = backend_->name();
  render_ctx_.cwd = cwd_;
  render_ctx_.unicode = ui::use_unicode();
}

App::~App() { shutdown(); }

ApplyContext App::apply_context() const {
  ApplyContext ctx;
  ctx.now = Clock::now();
  ctx.flash_ttl = milliseconds(cfg_.timing.flash_ms);
  ctx.cwd = cwd_;
  return ctx;
}

void App::sync_size() {
  cols_ = std::max(ui::kMinCols, ui::term_cols());
  rows_ = std::max(ui::kMinRows, ui::term_rows());
  state_.screen_rows = rows_;
  if (state_.log) {
    state_.log->scroll = model::clamp_scroll(state_.log->scroll, (int)state_.log->lines.size(), ui::log_rows(rows_));
  }
}

void App::request_refresh(bool silent) {
  if (!refresh_.try_begin()) return;  // one discovery at a time
  discovery_worker_.submit([this, silent]{
    Completion c;
    c.kind = Completion::Kind::Discovery;
    c.discovery = run_discovery(*backend_, silent);
    completions_.post(std::move(c));
  });
}

void App::dispatch_action(const Effect& e) {
  if (state_.busy) return;
  begin_action(state_);
  next_spin_ = Clock::now() + milliseconds(cfg_.timing.spinner_ms);
  std::string target = e.kind == Effect::Kind::Create ? e.request.name : e.name;
  events_.record("action", effect_label(e) + " " + target);
  action_worker_.submit([this, e]{
    Completion c;
    c.kind = Completion::Kind::Action;
    c.action = run_action(*backend_, e);
    completions_.post(std::move(c));
  });
}

void App::handle_effects(const std::vector<Effect>& effects) {
  for (const auto& e : effects) {
    switch (e.kind) {
      case Effect::Kind::Control:
      case Effect::Kind::Create:
      case Effect::Kind::Remove:
        dispatch_action(e);
        break;
      case Effect::Kind::StartLogs:
        try {
          if (!state_.log) state_.log = model::LogState{};
          tail_.start(e.name, *state_.log);
        } catch (const std::exception& ex) {
          auto ctx = apply_context();
          model::enter_mode(state_, Mode::Dashboard);
          model::set_flash(state_, Tone::Error, std::string("✗ logs failed: ") + ex.what(), ctx.now, ctx.flash_ttl);
          events_.record("logs", e.name + ": " + ex.what());
        }
        break;
      case Effect::Kind::StopLogs:
        tail_.stop();
        break;
      case Effect::Kind::Refresh:
        request_refresh(e.silent);
        break;
      case Effect::Kind::Quit:
        quit_ = true;
        break;
    }
  }
}

void App::apply_completions() {
  for (auto& c : completions_.take()) {
    auto ctx = apply_context();
    if (c.kind == Completion::Kind::Discovery) {
      refresh_.complete(state_, c.discovery, ctx);
      if (!c.discovery.records) events_.record("refresh", "failed: " + c.discovery.error);
      continue;
    }
    const ActionOutcome& o = c.action;
    auto f = complete_action(state_, o, ctx);
    std::string target = o.effect.kind == Effect::Kind::Create ? o.effect.request.name : o.effect.name;
    if (!o.result) events_.record("action", effect_label(o.effect) + " " + target + " threw: " + o.error);
    else events_.record("action", effect_label(o.effect) + " " + target + (o.result->ok ? " ok" : " failed: " + o.result->message));
    if (f.refresh_now) request_refresh(true);
    if (f.reconcile_later) refresh_.request_at(ctx.now + milliseconds(cfg_.timing.reconcile_ms));
  }
}

void App::read_input(bool hangup) {
  char buf[512];
  for (;;) {
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n > 0) {
      auto events = decoder_.feed(buf, (size_t)n);
      if (decoder_.has_pending()) input_pending_since_ = Clock::now();
      for (const auto& ev : events) {
        handle_effects(apply(state_, ev, apply_context()));
        if (quit_) return;
      }
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    // With VMIN=0 a drained tty also reads 0; only a hangup means it is gone
    if (n == 0 && !hangup) return;
    quit_ = true;
    return;
  }
}

void App::pump_logs() {
  if (!state_.log || tail_.phase() != LogTail::Phase::Streaming) return;
  if (tail_.drain(*state_.log)) {
    state_.log->scroll = model::clamp_scroll(state_.log->scroll, (int)state_.log->lines.size(), ui::log_rows(rows_));
  }
  const std::string service = tail_.service();
  if (auto code = tail_.reap(*state_.log)) {
    state_.log->scroll = model::clamp_scroll(state_.log->scroll, (int)state_.log->lines.size(), ui::log_rows(rows_));
    events_.record("logs", service + " follower exited " + std::to_string(*code));
    if (*code != 0) {
      auto ctx = apply_context();
      model::set_flash(state_, Tone::Error, service + " logs exited " + std::to_string(*code), ctx.now, ctx.flash_ttl);
    }
  }
}

void App::tick(Clock::time_point now) {
  model::expire_flash(state_, now);
  if (state_.busy && now >= next_spin_) {
    state_.spinner_frame = (state_.spinner_frame + 1) % ui::kSpinnerFrames;
    next_spin_ = now + milliseconds(cfg_.timing.spinner_ms);
  }
  if (decoder_.has_pending() && now - input_pending_since_ >= kInputPendingTimeout) {
    for (const auto& ev : decoder_.flush()) handle_effects(apply(state_, ev, apply_context()));
  }
  if (refresh_.due(now)) request_refresh(true);
}

bool App::paint() {
  render_ctx_.streaming = tail_.phase() == LogTail::Phase::Streaming;
  auto lines = ui::render(state_, cols_, rows_, render_ctx_);
  std::string out = screen_.paint(lines);
  if (out.empty()) return true;
  return ui::write_all(STDOUT_FILENO, out);
}

int App::poll_timeout_ms(Clock::time_point now) const {
  auto deadline = refresh_.next_deadline();
  if (state_.flash) deadline = std::min(deadline, state_.flash->expires);
  if (state_.busy) deadline = std::min(deadline, next_spin_);
  if (decoder_.has_pending()) deadline = std::min(deadline, input_pending_since_ + kInputPendingTimeout);
  if (tail_.phase() == LogTail::Phase::Streaming && tail_.fds().empty()) deadline = std::min(deadline, now + kReapTick);
  auto ms = duration_cast<milliseconds>(deadline - now).count();
  return (int)std::clamp<long long>(ms, 0, 1000);
}

int App::run() {
  sync_size();
  auto now = Clock::now();
  refresh_.start(now);
  discovery_worker_.start();
  action_worker_.start();
  request_refresh(false);

  while (!quit_ && !ui::g_stop.load()) {
    if (ui::g_resized.exchange(false)) {
      sync_size();
      screen_.invalidate();
    }
    now = Clock::now();
    tick(now);
    if (quit_) break;
    if (!paint()) {
      exit_code_ = 1;
      break;
    }

    std::vector<struct pollfd> fds;
    fds.push_back({STDIN_FILENO, POLLIN, 0});
    fds.push_back({completions_.fd(), POLLIN, 0});
    for (int fd : tail_.fds()) fds.push_back({fd, POLLIN, 0});

    int rv = ::poll(fds.data(), (nfds_t)fds.size(), poll_timeout_ms(now));
    if (rv < 0) {
      if (errno == EINTR) continue;  // SIGWINCH or a stop signal
      exit_code_ = 1;
      break;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) read_input((fds[0].revents & (POLLHUP | POLLERR)) != 0);
    if (fds[1].revents & POLLIN) apply_completions();
    pump_logs();
  }
  shutdown();
  return exit_code_;
}

void App::shutdown() {
  tail_.stop();
  action_worker_.stop();
  discovery_worker_.stop();
}

} // namespace svcdash::app
