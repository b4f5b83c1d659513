#pragma once

#include "model/AppState.hpp"
#include "ui/Input.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace svcdash::app {

// Side effect requested by a transition; carried out by the event loop.
struct Effect {
  enum class Kind { Control, Create, Remove, StartLogs, StopLogs, Refresh, Quit };

  Kind kind{Kind::Quit};
  model::ControlAction action{model::ControlAction::Start};
  std::string name;              // Control, Remove, StartLogs
  model::CreateRequest request;  // Create
  bool silent{false};            // Refresh

  static Effect control(model::ControlAction a, std::string n) { Effect e; e.kind = Kind::Control; e.action = a; e.name = std::move(n); return e; }
  static Effect create(model::CreateRequest r) { Effect e; e.kind = Kind::Create; e.request = std::move(r); return e; }
  static Effect remove(std::string n) { Effect e; e.kind = Kind::Remove; e.name = std::move(n); return e; }
  static Effect start_logs(std::string n) { Effect e; e.kind = Kind::StartLogs; e.name = std::move(n); return e; }
  static Effect stop_logs() { Effect e; e.kind = Kind::StopLogs; return e; }
  static Effect refresh(bool silent) { Effect e; e.kind = Kind::Refresh; e.silent = silent; return e; }
  static Effect quit() { Effect e; e.kind = Kind::Quit; return e; }
};

struct ApplyContext {
  model::Clock::time_point now{};
  std::chrono::milliseconds flash_ttl{3000};
  std::string cwd;  // working directory recorded on created services
};

// Apply one key event to the state. Performs no I/O; everything the
// outside world must do is returned as effects, in order.
std::vector<Effect> apply(model::AppState& s, const ui::KeyEvent& ev, const ApplyContext& ctx);

} // namespace svcdash::app
