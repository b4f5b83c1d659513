#pragma once

#include "app/Backend.hpp"
#include "app/EventLog.hpp"
#include "app/LogTail.hpp"
#include "app/Refresh.hpp"
#include "app/StateMachine.hpp"
#include "app/Worker.hpp"
#include "model/AppState.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Screen.hpp"
#include <memory>
#include <string>

namespace svcdash::app {

// The event loop. Owns the state, the screen and the log follower, and
// multiplexes stdin, log pipes and worker completions with poll().
// Terminal modes are set up by the caller.
class App {
public:
  App(ui::Config cfg, std::unique_ptr<IServiceBackend> backend, EventLog& events);
  ~App();
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // Runs until quit or a stop signal. Returns the process exit code.
  int run();

private:
  void handle_effects(const std::vector<Effect>& effects);
  void dispatch_action(const Effect& e);
  void request_refresh(bool silent);
  void apply_completions();
  void read_input(bool hangup);
  void pump_logs();
  void tick(model::Clock::time_point now);
  bool paint();
  void sync_size();
  [[nodiscard]] int poll_timeout_ms(model::Clock::time_point now) const;
  [[nodiscard]] ApplyContext apply_context() const;
  void shutdown();

  ui::Config cfg_;
  std::unique_ptr<IServiceBackend> backend_;
  EventLog& events_;

  model::AppState state_;
  ui::Screen screen_;
  ui::InputDecoder decoder_;
  ui::RenderContext render_ctx_;
  LogTail tail_;
  RefreshLoop refresh_;
  std::string cwd_;
  int cols_{80};
  int rows_{24};

  bool quit_{false};
  int exit_code_{0};
  model::Clock::time_point next_spin_{};
  model::Clock::time_point input_pending_since_{};

  CompletionQueue completions_;
  Worker discovery_worker_{"discovery"};
  Worker action_worker_{"action"};
};

} // namespace svcdash::app
