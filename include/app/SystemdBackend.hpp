#pragma once

#include "app/Backend.hpp"
#include <string>
#include <vector>

namespace svcdash::app {

inline constexpr const char* kSudoRequired = "sudo required – run 'sudo -v' in another terminal first";

// IServiceBackend over systemctl/journalctl. Mutating commands run through
// `sudo -n` unless use_sudo is off, so a missing credential cache fails fast
// instead of prompting on the dashboard's terminal.
class SystemdBackend : public IServiceBackend {
public:
  SystemdBackend(bool use_sudo, std::string unit_dir, int log_backlog);

  [[nodiscard]] std::string name() const override { return "systemd"; }

  std::vector<model::ServiceRecord> discover() override;
  model::ActionResult control(model::ControlAction action, const std::string& service) override;
  model::ActionResult create(const model::CreateRequest& req) override;
  model::ActionResult remove(const std::string& service) override;
  util::Child follow_log(const std::string& service) override;

private:
  [[nodiscard]] std::vector<std::string> privileged(std::vector<std::string> argv) const;

  bool use_sudo_;
  std::string unit_dir_;
  int log_backlog_;
};

// Merge `systemctl list-units --plain --no-legend` with
// `systemctl list-unit-files --no-legend` output. Units whose load state is
// not-found are skipped; the result is sorted by name.
std::vector<model::ServiceRecord> parse_systemd_units(const std::string& units,
                                                      const std::string& unit_files);

// Unit file text for a created service.
std::string render_unit_file(const model::CreateRequest& req);

// Diagnostic for a failed command: the sudo hint when sudo refused,
// otherwise stdout and stderr joined.
std::string failure_text(const util::ExecResult& r);

} // namespace svcdash::app
