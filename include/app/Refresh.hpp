#pragma once

#include "app/Backend.hpp"
#include "app/StateMachine.hpp"
#include "model/AppState.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace svcdash::app {

struct DiscoveryOutcome {
  bool silent{true};
  std::optional<std::vector<model::ServiceRecord>> records;  // absent on failure
  std::string error;
};

// Call backend.discover(). Runs on a worker thread; never throws.
DiscoveryOutcome run_discovery(IServiceBackend& backend, bool silent);

// Drop malformed and duplicate records, keeping discovery order. Status
// text is scrubbed to a single display line.
std::vector<model::ServiceRecord> sanitize_records(std::vector<model::ServiceRecord> records);

// Periodic + on-demand discovery scheduling with at most one poll in flight.
class RefreshLoop {
public:
  explicit RefreshLoop(std::chrono::milliseconds interval) : interval_(interval) {}

  void start(model::Clock::time_point now) { next_periodic_ = now + interval_; }

  // One-shot silent refresh no earlier than `at` (earliest request wins).
  void request_at(model::Clock::time_point at);

  // Consume timers that are due; true when a silent refresh should fire.
  bool due(model::Clock::time_point now);

  // Earliest pending timer.
  [[nodiscard]] model::Clock::time_point next_deadline() const;

  // Claim the single in-flight slot. False means the request is dropped.
  bool try_begin();
  [[nodiscard]] bool in_flight() const { return in_flight_; }

  // Fold a discovery result into the state and release the slot. Returns
  // true when the displayed service list changed.
  bool complete(model::AppState& s, const DiscoveryOutcome& o, const ApplyContext& ctx);

private:
  std::chrono::milliseconds interval_;
  model::Clock::time_point next_periodic_{};
  std::optional<model::Clock::time_point> reconcile_at_;
  bool in_flight_{false};
};

} // namespace svcdash::app
