#include "app/SystemdBackend.hpp"
#include "ui/Config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace svcdash::app {

using model::ActionResult;
using model::ServiceRecord;
using util::run_capture;

static std::vector<std::string> split_ws(const std::string& line) {
  std::vector<std::string> out;
  std::istringstream is(line);
  std::string tok;
  while (is >> tok) out.push_back(tok);
  return out;
}

static std::string strip_suffix(std::string s, const std::string& suffix) {
  if (s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
    s.erase(s.size() - suffix.size());
  return s;
}

static std::string join_output(const util::ExecResult& r) {
  std::string s = r.out;
  if (!r.err.empty()) {
    if (!s.empty()) s += ' ';
    s += r.err;
  }
  return s;
}

std::string failure_text(const util::ExecResult& r) {
  if (r.err.find("sudo:") != std::string::npos) return kSudoRequired;
  return join_output(r);
}

std::vector<ServiceRecord> parse_systemd_units(const std::string& units, const std::string& unit_files) {
  std::map<std::string, std::string> enable_state;
  {
    std::istringstream is(unit_files);
    std::string line;
    while (std::getline(is, line)) {
      auto parts = split_ws(line);
      if (parts.size() < 2) continue;
      enable_state[strip_suffix(parts[0], ".service")] = parts[1];
    }
  }

  std::vector<ServiceRecord> out;
  std::istringstream is(units);
  std::string line;
  while (std::getline(is, line)) {
    auto parts = split_ws(line);
    // Failed units carry a leading bullet when --plain is not honoured
    if (!parts.empty() && parts[0] == "\xE2\x97\x8F") parts.erase(parts.begin());
    if (parts.size() < 4) continue;
    if (parts[1] == "not-found") continue;
    ServiceRecord r;
    r.name = strip_suffix(parts[0], ".service");
    r.active = parts[2] == "active";
    r.status = parts[2] + " (" + parts[3] + ")";
    auto it = enable_state.find(r.name);
    if (it != enable_state.end()) {
      if (it->second == "enabled") r.enabled = true;
      else if (it->second == "disabled") r.enabled = false;
    }
    out.push_back(std::move(r));
  }
  std::sort(out.begin(), out.end(), [](const ServiceRecord& a, const ServiceRecord& b){ return a.name < b.name; });
  return out;
}

std::string render_unit_file(const model::CreateRequest& req) {
  std::string u;
  u += "[Unit]\n";
  u += "Description=" + req.name + "\n";
  u += "\n[Service]\n";
  u += "ExecStart=" + req.command + "\n";
  if (!req.working_directory.empty()) u += "WorkingDirectory=" + req.working_directory + "\n";
  u += "Restart=on-failure\n";
  u += "RestartSec=5\n";
  u += "\n[Install]\n";
  u += "WantedBy=multi-user.target\n";
  return u;
}

std::unique_ptr<IServiceBackend> make_backend(const ui::Config& cfg) {
  if (cfg.backend.kind == "systemd")
    return std::make_unique<SystemdBackend>(cfg.backend.use_sudo, cfg.backend.unit_dir, cfg.backend.log_backlog);
  throw std::invalid_argument("unknown backend '" + cfg.backend.kind + "'");
}

SystemdBackend::SystemdBackend(bool use_sudo, std::string unit_dir, int log_backlog)
    : use_sudo_(use_sudo), unit_dir_(std::move(unit_dir)), log_backlog_(log_backlog) {}

std::vector<std::string> SystemdBackend::privileged(std::vector<std::string> argv) const {
  if (use_sudo_) argv.insert(argv.begin(), {"sudo", "-n"});
  return argv;
}

std::vector<ServiceRecord> SystemdBackend::discover() {
  util::ExecResult units, files;
  try {
    units = run_capture({"systemctl", "list-units", "--type=service", "--all", "--no-legend", "--no-pager", "--plain"});
    files = run_capture({"systemctl", "list-unit-files", "--type=service", "--no-legend", "--no-pager"});
  } catch (const std::system_error& e) {
    throw DiscoveryError(e.what());
  }
  if (units.code != 0) {
    throw DiscoveryError(units.err.empty() ? "systemctl exited " + std::to_string(units.code) : units.err);
  }
  // list-unit-files failing only costs the enabled column
  return parse_systemd_units(units.out, files.code == 0 ? files.out : std::string());
}

ActionResult SystemdBackend::control(model::ControlAction action, const std::string& service) {
  auto r = run_capture(privileged({"systemctl", model::action_verb(action), service}));
  if (r.code != 0) return {false, failure_text(r)};
  return {true, join_output(r)};
}

ActionResult SystemdBackend::create(const model::CreateRequest& req) {
  // The name becomes a file name and a unit key
  if (!model::valid_service_name(req.name) || req.name.find_first_of("/=") != std::string::npos)
    return {false, "Invalid service name"};

  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  tmp /= "svcdash-" + std::to_string(::getpid()) + "-" + req.name + ".service";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return {false, "cannot write " + tmp.string()};
    out << render_unit_file(req);
    if (!out) return {false, "cannot write " + tmp.string()};
  }

  const std::string dest = unit_dir_ + "/" + req.name + ".service";
  auto cp = run_capture(privileged({"cp", tmp.string(), dest}));
  fs::remove(tmp, ec);
  if (cp.code != 0) return {false, failure_text(cp)};

  auto reload = run_capture(privileged({"systemctl", "daemon-reload"}));
  if (reload.code != 0) return {false, failure_text(reload)};
  auto enable = run_capture(privileged({"systemctl", "enable", req.name}));
  if (enable.code != 0) return {false, failure_text(enable)};
  return {true, dest};
}

ActionResult SystemdBackend::remove(const std::string& service) {
  auto show = run_capture({"systemctl", "show", "-p", "FragmentPath", service + ".service"});
  std::string path = show.out;
  if (path.rfind("FragmentPath=", 0) == 0) path.erase(0, 13);
  if (show.code != 0 || path.empty()) return {false, "Unit file not found"};

  auto stop = run_capture(privileged({"systemctl", "stop", service}));
  if (stop.code != 0) return {false, failure_text(stop)};
  auto disable = run_capture(privileged({"systemctl", "disable", service}));
  if (disable.code != 0) return {false, failure_text(disable)};
  auto rm = run_capture(privileged({"rm", "-f", path}));
  if (rm.code != 0) return {false, failure_text(rm)};
  auto reload = run_capture(privileged({"systemctl", "daemon-reload"}));
  if (reload.code != 0) return {false, failure_text(reload)};
  return {true, "Removed " + path};
}

util::Child SystemdBackend::follow_log(const std::string& service) {
  return util::spawn_piped({"journalctl", "-u", service, "-f", "-n", std::to_string(log_backlog_), "--no-pager"});
}

} // namespace svcdash::app
