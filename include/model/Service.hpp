#pragma once

#include <optional>
#include <string>
#include <vector>

namespace svcdash::model {

// One discovered unit. Identity is by name.
struct ServiceRecord {
  std::string name;
  bool active{false};
  std::string status;            // e.g. "active (running)"
  std::optional<bool> enabled;   // absent when the backend cannot tell

  bool operator==(const ServiceRecord&) const = default;
};

enum class ControlAction { Start, Stop, Restart, Enable, Disable };

struct ActionResult {
  bool ok{false};
  std::string message;  // created path on success, diagnostic on failure
};

struct CreateRequest {
  std::string name;
  std::string command;
  std::string working_directory;
};

// Optimistic overlay applied on top of the last confirmed record.
struct ServicePatch {
  std::optional<bool> active;
  std::optional<std::string> status;
  std::optional<bool> enabled;
  bool removed{false};
};

struct ServiceEntry {
  ServiceRecord confirmed;
  std::optional<ServicePatch> pending;

  [[nodiscard]] ServiceRecord view() const {
    ServiceRecord r = confirmed;
    if (!pending) return r;
    if (pending->active) r.active = *pending->active;
    if (pending->status) r.status = *pending->status;
    if (pending->enabled) r.enabled = *pending->enabled;
    return r;
  }
  [[nodiscard]] bool hidden() const { return pending && pending->removed; }
};

// Names must be non-empty and free of whitespace and control bytes.
[[nodiscard]] bool valid_service_name(const std::string& name);

[[nodiscard]] const char* action_verb(ControlAction a);
[[nodiscard]] const char* action_past_tense(ControlAction a);

} // namespace svcdash::model
