#pragma once

#include "model/Service.hpp"
#include "util/Subprocess.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcdash::ui { struct Config; }

namespace svcdash::app {

// Raised by discover() when the service list cannot be obtained at all.
class DiscoveryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Capability set the engine needs from a service manager. Implementations
// may block; the engine only calls them from worker threads (follow_log
// excepted, which only spawns).
class IServiceBackend {
public:
  virtual ~IServiceBackend() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  virtual std::vector<model::ServiceRecord> discover() = 0;
  virtual model::ActionResult control(model::ControlAction action, const std::string& service) = 0;
  virtual model::ActionResult create(const model::CreateRequest& req) = 0;
  virtual model::ActionResult remove(const std::string& service) = 0;

  // Start a long-running follower for the service's log. Throws
  // std::system_error when it cannot be spawned.
  virtual util::Child follow_log(const std::string& service) = 0;
};

// Backend selected by config.backend.kind. Throws std::invalid_argument
// for an unknown kind.
std::unique_ptr<IServiceBackend> make_backend(const ui::Config& cfg);

} // namespace svcdash::app
