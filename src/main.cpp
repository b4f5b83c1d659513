#include "app/App.hpp"
#include "app/Backend.hpp"
#include "app/EventLog.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace svcdash;

static void print_usage() {
  std::cout << "Usage: svcdash [--refresh-ms MS] [--no-alt-screen] [--log-file PATH]\n"
               "               [--backend KIND] [--config PATH]\n";
  std::cout << "Keys: arrows/j/k move  / search  s start/stop  r restart  e enable/disable\n"
               "      l logs  a add  d remove  R refresh  esc quit\n";
  std::cout << "Config: " << ui::config_file_path() << " (env SVCDASH_* overrides defaults)\n";
}

int main(int argc, char** argv) {
  std::setlocale(LC_ALL, "");

  std::string config_path = ui::config_file_path();
  int refresh_ms = -1;
  bool no_alt = false;
  std::string log_file;
  std::string backend_kind;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--refresh-ms" && i + 1 < argc) refresh_ms = std::stoi(argv[++i]);
      else if (a == "--no-alt-screen") no_alt = true;
      else if (a == "--log-file" && i + 1 < argc) log_file = argv[++i];
      else if (a == "--backend" && i + 1 < argc) backend_kind = argv[++i];
      else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (a == "-h" || a == "--help") { print_usage(); return 0; }
      else {
        std::fprintf(stderr, "svcdash: unknown argument '%s'\n", a.c_str());
        print_usage();
        return 2;
      }
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "svcdash: bad argument value: %s\n", e.what());
    return 2;
  }

  ui::Config cfg = ui::load_config(config_path);
  if (refresh_ms > 0) cfg.timing.refresh_ms = std::max(250, refresh_ms);
  if (no_alt) cfg.ui.alt_screen = false;
  if (!log_file.empty()) cfg.log.path = log_file;
  if (!backend_kind.empty()) cfg.backend.kind = backend_kind;

  std::unique_ptr<app::IServiceBackend> backend;
  try {
    backend = app::make_backend(cfg);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "svcdash: %s\n", e.what());
    return 2;
  }

  if (!ui::tty_stdin() || !ui::tty_stdout()) {
    std::fprintf(stderr, "svcdash: stdin and stdout must be a terminal\n");
    return 1;
  }

  app::EventLog events(cfg.log.path);
  events.start();
  events.record("start", "backend " + backend->name());

  int code = 0;
  std::string fatal;
  ui::install_signal_handlers();
  std::atexit(&ui::on_atexit_restore);
  {
    ui::RawTermGuard raw{};
    if (!raw.active()) {
      fatal = "cannot put the terminal into raw mode";
    } else {
      ui::CursorGuard curs{};
      ui::AltScreenGuard alt{cfg.ui.alt_screen};
      try {
        app::App dashboard(cfg, std::move(backend), events);
        code = dashboard.run();
      } catch (const std::exception& e) {
        fatal = e.what();
      }
    }
  }
  // Guards have restored the terminal; stderr is safe again

  if (!fatal.empty()) {
    events.record("fatal", fatal);
    std::fprintf(stderr, "svcdash: %s\n", fatal.c_str());
    code = 1;
  }
  events.record("stop", "exit " + std::to_string(code));
  events.stop();
  return code;
}
