#include "app/Actions.hpp"
#include <exception>

namespace svcdash::app {

using model::ControlAction;
using model::ServicePatch;
using model::Tone;

std::string effect_label(const Effect& e) {
  switch (e.kind) {
    case Effect::Kind::Control: return model::action_verb(e.action);
    case Effect::Kind::Create:  return "create";
    case Effect::Kind::Remove:  return "remove";
    default: return "action";
  }
}

void begin_action(model::AppState& s) {
  s.busy = true;
  s.spinner_frame = 0;
}

ActionOutcome run_action(IServiceBackend& backend, const Effect& e) {
  ActionOutcome o;
  o.effect = e;
  try {
    switch (e.kind) {
      case Effect::Kind::Control: o.result = backend.control(e.action, e.name); break;
      case Effect::Kind::Create:  o.result = backend.create(e.request); break;
      case Effect::Kind::Remove:  o.result = backend.remove(e.name); break;
      default: o.error = "not an action"; break;
    }
  } catch (const std::exception& ex) {
    o.result.reset();
    o.error = ex.what();
  }
  return o;
}

void apply_patch(model::AppState& s, const std::string& name, const ServicePatch& patch) {
  for (auto& entry : s.services) {
    if (entry.confirmed.name != name) continue;
    ServicePatch merged = entry.pending.value_or(ServicePatch{});
    if (patch.active) merged.active = patch.active;
    if (patch.status) merged.status = patch.status;
    if (patch.enabled) merged.enabled = patch.enabled;
    merged.removed = merged.removed || patch.removed;
    entry.pending = std::move(merged);
    return;
  }
}

static ServicePatch optimistic_patch(ControlAction a) {
  ServicePatch p;
  switch (a) {
    case ControlAction::Start:
    case ControlAction::Restart: p.active = true;  p.status = "running"; break;
    case ControlAction::Stop:    p.active = false; p.status = "stopped"; break;
    case ControlAction::Enable:  p.enabled = true; break;
    case ControlAction::Disable: p.enabled = false; break;
  }
  return p;
}

ActionFollowup complete_action(model::AppState& s, const ActionOutcome& o, const ApplyContext& ctx) {
  s.busy = false;
  ActionFollowup f;
  const Effect& e = o.effect;

  if (!o.result) {
    model::set_flash(s, Tone::Error, "✗ " + effect_label(e) + " failed: " + o.error, ctx.now, ctx.flash_ttl);
    f.reconcile_later = true;
    return f;
  }
  const auto& r = *o.result;
  if (!r.ok) {
    std::string text = r.message.empty() ? effect_label(e) + " failed" : r.message;
    model::set_flash(s, Tone::Error, "✗ " + text, ctx.now, ctx.flash_ttl);
    f.reconcile_later = true;
    return f;
  }

  switch (e.kind) {
    case Effect::Kind::Control:
      apply_patch(s, e.name, optimistic_patch(e.action));
      model::set_flash(s, Tone::Success, "✓ " + e.name + " " + model::action_past_tense(e.action), ctx.now, ctx.flash_ttl);
      f.reconcile_later = true;
      break;
    case Effect::Kind::Remove: {
      ServicePatch p;
      p.removed = true;
      apply_patch(s, e.name, p);
      model::clamp_selection(s);
      model::set_flash(s, Tone::Success, "✓ Removed " + e.name, ctx.now, ctx.flash_ttl);
      f.reconcile_later = true;
      break;
    }
    case Effect::Kind::Create:
      if (s.mode == model::Mode::AddForm) model::enter_mode(s, model::Mode::Dashboard);
      model::set_flash(s, Tone::Success, "✓ Created " + e.request.name + " → " + r.message, ctx.now, ctx.flash_ttl);
      f.refresh_now = true;
      break;
    default:
      break;
  }
  return f;
}

} // namespace svcdash::app
