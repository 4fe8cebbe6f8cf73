#include "minitest.hpp"
#include "app/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace combre::app;

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/combre_test_config_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

static void clear_env() {
  for (const char* n : {"COMBRE_TRACE", "combre_trace", "COMBRE_SHORT_CIRCUIT",
                        "combre_short_circuit", "COMBRE_PATTERN", "combre_pattern"})
    ::unsetenv(n);
}

TEST(config_defaults_without_file) {
  clear_env();
  auto c = load_config("/tmp/combre_test_config_missing.toml");
  ASSERT_TRUE(c.short_circuit);
  ASSERT_FALSE(c.trace);
  ASSERT_EQ(c.pattern, "decimal");
}

TEST(config_from_toml) {
  clear_env();
  auto path = tmp_path("basic");
  write_file(path,
    "[match]\n"
    "short_circuit = false\n"
    "trace = true\n"
    "pattern = \"binary\"\n");
  auto c = load_config(path);
  ASSERT_FALSE(c.short_circuit);
  ASSERT_TRUE(c.trace);
  ASSERT_EQ(c.pattern, "binary");
  auto o = to_match_options(c);
  ASSERT_FALSE(o.short_circuit);
  ASSERT_TRUE(o.trace);
  remove_file(path);
}

TEST(config_env_fallback) {
  clear_env();
  ::setenv("COMBRE_TRACE", "1", 1);
  ::setenv("combre_pattern", "identifier", 1);
  ::setenv("COMBRE_SHORT_CIRCUIT", "no", 1);
  auto c = load_config(std::string());
  ASSERT_TRUE(c.trace);
  ASSERT_EQ(c.pattern, "identifier");
  ASSERT_FALSE(c.short_circuit);
  clear_env();
}

TEST(config_toml_beats_env) {
  clear_env();
  ::setenv("COMBRE_PATTERN", "integer", 1);
  auto path = tmp_path("precedence");
  write_file(path, "[match]\npattern = binary\n");
  auto c = load_config(path);
  ASSERT_EQ(c.pattern, "binary");
  remove_file(path);
  clear_env();
}

TEST(config_malformed_file_is_ignored) {
  clear_env();
  auto path = tmp_path("malformed");
  write_file(path, "[match]\ntrace = true\nthis is not toml\n");
  auto c = load_config(path);
  ASSERT_FALSE(c.trace);
  ASSERT_EQ(c.pattern, "decimal");
  remove_file(path);
}

TEST(config_file_path_prefers_xdg) {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(config_file_path(), "/tmp/xdg/combre/config.toml");
  if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
}
