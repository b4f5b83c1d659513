#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace svcdash::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SVCDASH_", 0) == 0) {
    alt = std::string("svcdash_") + n.substr(8);
  } else if (n.rfind("svcdash_", 0) == 0) {
    alt = std::string("SVCDASH_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/svcdash/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/svcdash/config.toml";
  return {};
}

// Resolve a color role from TOML -> env -> compiled default.
// Value can be an integer (palette index) or "#RRGGBB" (truecolor).
static std::string resolve_color(const svcdash::util::TomlReader& toml, bool have_toml,
                                 const char* role, const char* env_name, int def_palette_idx) {
  std::string val;
  if (have_toml && toml.has("roles", role)) val = toml.get_string("roles", role);
  else if (const char* e = getenv_compat(env_name)) val = e;
  if (!val.empty() && (std::isdigit(static_cast<unsigned char>(val[0])))) {
    int idx = def_palette_idx;
    try { idx = std::stoi(val); } catch (const std::exception&) { idx = def_palette_idx; }
    return sgr_palette_idx(idx);
  }
  if (val.size() == 7 && val[0] == '#') {
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) {
      return truecolor_capable() ? sgr_truecolor(r, g, b) : sgr_palette_idx(def_palette_idx);
    }
  }
  return sgr_palette_idx(def_palette_idx);
}

static int resolve_int(const svcdash::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const svcdash::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const svcdash::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  svcdash::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [roles] ---
  c.theme.accent  = resolve_color(toml, have_toml, "accent",  "SVCDASH_ACCENT_IDX", 14);
  c.theme.success = resolve_color(toml, have_toml, "success", "SVCDASH_SUCCESS_IDX", 2);
  c.theme.error   = resolve_color(toml, have_toml, "error",   "SVCDASH_ERROR_IDX", 1);
  c.theme.info    = resolve_color(toml, have_toml, "info",    "SVCDASH_INFO_IDX", 6);
  c.theme.muted   = resolve_color(toml, have_toml, "muted",   "SVCDASH_MUTED_IDX", 8);
  c.theme.cursor  = resolve_color(toml, have_toml, "cursor",  "SVCDASH_CURSOR_IDX", 3);
  c.theme.bold    = sgr_bold();
  c.theme.reset   = sgr_reset();

  // --- [timing] ---
  c.timing.refresh_ms   = std::clamp(resolve_int(toml, have_toml, "timing", "refresh_ms",   "SVCDASH_REFRESH_MS", 3000), 250, 600000);
  c.timing.flash_ms     = std::clamp(resolve_int(toml, have_toml, "timing", "flash_ms",     "SVCDASH_FLASH_MS", 3000), 250, 60000);
  c.timing.reconcile_ms = std::clamp(resolve_int(toml, have_toml, "timing", "reconcile_ms", "SVCDASH_RECONCILE_MS", 500), 0, 60000);
  c.timing.spinner_ms   = std::clamp(resolve_int(toml, have_toml, "timing", "spinner_ms",   "SVCDASH_SPINNER_MS", 80), 16, 1000);

  // --- [ui] ---
  c.ui.alt_screen = resolve_bool(toml, have_toml, "ui", "alt_screen", "SVCDASH_ALT_SCREEN", true);
  c.ui.title      = resolve_string(toml, have_toml, "ui", "title", "SVCDASH_TITLE", "Service Manager");

  // --- [backend] ---
  c.backend.kind        = resolve_string(toml, have_toml, "backend", "kind",        "SVCDASH_BACKEND", "systemd");
  c.backend.use_sudo    = resolve_bool(toml, have_toml,   "backend", "use_sudo",    "SVCDASH_USE_SUDO", true);
  c.backend.unit_dir    = resolve_string(toml, have_toml, "backend", "unit_dir",    "SVCDASH_UNIT_DIR", "/etc/systemd/system");
  c.backend.log_backlog = std::clamp(resolve_int(toml, have_toml, "backend", "log_backlog", "SVCDASH_LOG_BACKLOG", 50), 0, 250);

  // --- [log] ---
  c.log.path = resolve_string(toml, have_toml, "log", "path", "SVCDASH_LOG_FILE", "");

  return c;
}

} // namespace svcdash::ui
