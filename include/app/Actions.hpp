#pragma once

#include "app/Backend.hpp"
#include "app/StateMachine.hpp"
#include "model/AppState.hpp"
#include <optional>
#include <string>

namespace svcdash::app {

// Result of one backend call made for a Control/Create/Remove effect.
struct ActionOutcome {
  Effect effect;
  std::optional<model::ActionResult> result;  // absent when the call threw
  std::string error;                          // exception text when it threw
};

// What the event loop must schedule after an action completes.
struct ActionFollowup {
  bool refresh_now{false};
  bool reconcile_later{false};
};

// Human label for an action effect ("start", "create", ...).
[[nodiscard]] std::string effect_label(const Effect& e);

// Mark the state busy for an action about to be dispatched.
void begin_action(model::AppState& s);

// Perform the backend call. Runs on a worker thread; never throws.
ActionOutcome run_action(IServiceBackend& backend, const Effect& e);

// Fold a finished action into the state: optimistic patch and notification
// on success, error notification otherwise. Always clears busy.
ActionFollowup complete_action(model::AppState& s, const ActionOutcome& o, const ApplyContext& ctx);

// Overlay `patch` on the named entry, merging with any pending patch.
void apply_patch(model::AppState& s, const std::string& name, const model::ServicePatch& patch);

} // namespace svcdash::app
