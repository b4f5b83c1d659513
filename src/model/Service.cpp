#include "model/Service.hpp"

namespace svcdash::model {

bool valid_service_name(const std::string& name) {
  if (name.empty()) return false;
  for (unsigned char c : name) {
    if (c <= 0x20 || c == 0x7F) return false;
  }
  return true;
}

const char* action_verb(ControlAction a) {
  switch (a) {
    case ControlAction::Start:   return "start";
    case ControlAction::Stop:    return "stop";
    case ControlAction::Restart: return "restart";
    case ControlAction::Enable:  return "enable";
    case ControlAction::Disable: return "disable";
  }
  return "?";
}

const char* action_past_tense(ControlAction a) {
  switch (a) {
    case ControlAction::Start:   return "started";
    case ControlAction::Stop:    return "stopped";
    case ControlAction::Restart: return "restarted";
    case ControlAction::Enable:  return "enabled";
    case ControlAction::Disable: return "disabled";
  }
  return "?";
}

} // namespace svcdash::model
