#include "app/Refresh.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <exception>
#include <unordered_set>

namespace svcdash::app {

using model::ServiceRecord;

DiscoveryOutcome run_discovery(IServiceBackend& backend, bool silent) {
  DiscoveryOutcome o;
  o.silent = silent;
  try {
    o.records = backend.discover();
  } catch (const std::exception& e) {
    o.records.reset();
    o.error = e.what();
  }
  return o;
}

std::vector<ServiceRecord> sanitize_records(std::vector<ServiceRecord> records) {
  std::vector<ServiceRecord> out;
  out.reserve(records.size());
  std::unordered_set<std::string> seen;
  for (auto& r : records) {
    if (!model::valid_service_name(r.name)) continue;
    if (!seen.insert(r.name).second) continue;
    r.status = ui::sanitize_text(r.status);
    out.push_back(std::move(r));
  }
  return out;
}

static std::vector<ServiceRecord> displayed(const model::AppState& s) {
  std::vector<ServiceRecord> v;
  v.reserve(s.services.size());
  for (const auto& e : s.services)
    if (!e.hidden()) v.push_back(e.view());
  return v;
}

void RefreshLoop::request_at(model::Clock::time_point at) {
  if (!reconcile_at_ || at < *reconcile_at_) reconcile_at_ = at;
}

bool RefreshLoop::due(model::Clock::time_point now) {
  bool fire = false;
  if (now >= next_periodic_) {
    next_periodic_ = now + interval_;
    fire = true;
  }
  if (reconcile_at_ && now >= *reconcile_at_) {
    reconcile_at_.reset();
    fire = true;
  }
  return fire;
}

model::Clock::time_point RefreshLoop::next_deadline() const {
  if (reconcile_at_) return std::min(*reconcile_at_, next_periodic_);
  return next_periodic_;
}

bool RefreshLoop::try_begin() {
  if (in_flight_) return false;
  in_flight_ = true;
  return true;
}

bool RefreshLoop::complete(model::AppState& s, const DiscoveryOutcome& o, const ApplyContext& ctx) {
  in_flight_ = false;
  if (!o.records) {
    model::set_flash(s, model::Tone::Error, "Refresh failed: " + o.error, ctx.now, ctx.flash_ttl);
    return false;
  }

  auto before = displayed(s);
  auto records = sanitize_records(*o.records);
  const bool found_nothing = records.empty();

  s.services.clear();
  s.services.reserve(records.size());
  for (auto& r : records) s.services.push_back(model::ServiceEntry{std::move(r), std::nullopt});
  model::clamp_selection(s);

  if (!o.silent && found_nothing)
    model::set_flash(s, model::Tone::Info, "No services discovered", ctx.now, ctx.flash_ttl);
  return displayed(s) != before;
}

} // namespace svcdash::app
