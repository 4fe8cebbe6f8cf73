#pragma once

#include <string>
#include "pattern/Matcher.hpp"

namespace combre::app {

struct Config {
  bool short_circuit{true};
  bool trace{false};
  std::string pattern{"decimal"};  // catalog name used by combre-check
};

// $XDG_CONFIG_HOME/combre/config.toml, else ~/.config/combre/config.toml,
// else empty.
std::string config_file_path();

// Resolve every field TOML -> env -> compiled default. A missing file is
// silent; an unreadable or malformed one is reported on stderr and skipped.
Config load_config();
Config load_config(const std::string& path);

pattern::MatchOptions to_match_options(const Config& c);

// Environment helpers. COMBRE_X falls back to combre_x and vice versa.
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);

} // namespace combre::app
