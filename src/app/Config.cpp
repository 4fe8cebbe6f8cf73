#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace combre::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("COMBRE_", 0) == 0) {
    alt = std::string("combre_") + n.substr(7);
  } else if (n.rfind("combre_", 0) == 0) {
    alt = std::string("COMBRE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/combre/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/combre/config.toml";
  return {};
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* key, const char* env_name, bool def) {
  if (have_toml && toml.has("match", key))
    return toml.get_bool("match", key, def);
  return env_flag(env_name, def);
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* key, const char* env_name, const std::string& def) {
  if (have_toml && toml.has("match", key))
    return toml.get_string("match", key, def);
  const char* v = getenv_compat(env_name);
  if (v && *v) return std::string(v);
  return def;
}

Config load_config(const std::string& path) {
  util::TomlReader toml;
  bool have_toml = false;
  if (!path.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      have_toml = toml.load(path);
      if (!have_toml) {
        std::fprintf(stderr, "combre: Config: ignoring %s: %s\n",
                     path.c_str(), toml.error().c_str());
      }
    }
  }

  Config c;
  c.short_circuit = resolve_bool(toml, have_toml, "short_circuit", "COMBRE_SHORT_CIRCUIT", c.short_circuit);
  c.trace         = resolve_bool(toml, have_toml, "trace", "COMBRE_TRACE", c.trace);
  c.pattern       = resolve_string(toml, have_toml, "pattern", "COMBRE_PATTERN", c.pattern);
  return c;
}

Config load_config() {
  return load_config(config_file_path());
}

pattern::MatchOptions to_match_options(const Config& c) {
  pattern::MatchOptions o;
  o.short_circuit = c.short_circuit;
  o.trace = c.trace;
  return o;
}

} // namespace combre::app
