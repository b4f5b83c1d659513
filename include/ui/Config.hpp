#pragma once

#include <string>

namespace svcdash::ui {

// Resolved SGR sequences for each color role. Empty strings render plain.
struct Theme {
  std::string accent;
  std::string success;
  std::string error;
  std::string info;
  std::string muted;
  std::string cursor;
  std::string bold;
  std::string reset;
};

struct Config {
  Theme theme;

  struct Timing {
    int refresh_ms{3000};
    int flash_ms{3000};
    int reconcile_ms{500};
    int spinner_ms{80};
  } timing;

  struct UI {
    bool alt_screen{true};
    std::string title{"Service Manager"};
  } ui;

  struct Backend {
    std::string kind{"systemd"};
    bool use_sudo{true};
    std::string unit_dir{"/etc/systemd/system"};
    int log_backlog{50};
  } backend;

  struct Log {
    std::string path;  // empty: event log disabled
  } log;
};

// Default config file location ($XDG_CONFIG_HOME/svcdash/config.toml or ~/.config/...)
std::string config_file_path();

// Resolve every key TOML -> env (SVCDASH_*) -> compiled default.
// A missing or unreadable file simply means "no TOML layer".
Config load_config(const std::string& path);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace svcdash::ui
