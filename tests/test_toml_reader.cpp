#include "minitest.hpp"
#include "util/TomlReader.hpp"

using combre::util::TomlReader;

TEST(toml_load_missing_file) {
  TomlReader tr;
  ASSERT_FALSE(tr.load("/tmp/combre_test_toml_nonexistent_file.toml"));
  ASSERT_TRUE(tr.error().find("cannot open") != std::string::npos);
}

TEST(toml_sections_and_values) {
  TomlReader tr;
  ASSERT_TRUE(tr.load_string(
    "# comment\n"
    "top = 1\n"
    "[match]\n"
    "trace = true   # inline comment\n"
    "pattern = \"binary\"\n"
    "\n"
    "[other]\n"
    "trace = false\n"));
  ASSERT_EQ(tr.get_string("", "top"), "1");
  ASSERT_TRUE(tr.get_bool("match", "trace"));
  ASSERT_EQ(tr.get_string("match", "pattern"), "binary");
  ASSERT_FALSE(tr.get_bool("other", "trace", true));
  ASSERT_TRUE(tr.has("other", "trace"));
  ASSERT_FALSE(tr.has("match", "missing"));
}

TEST(toml_defaults_for_missing_keys) {
  TomlReader tr;
  ASSERT_TRUE(tr.load_string("[match]\ntrace = maybe\n"));
  ASSERT_EQ(tr.get_string("match", "missing", "fallback"), "fallback");
  ASSERT_EQ(tr.get_bool("match", "trace", true), true);    // unparseable bool
  ASSERT_EQ(tr.get_bool("nosection", "key", false), false);
}

TEST(toml_later_key_wins) {
  TomlReader tr;
  ASSERT_TRUE(tr.load_string("[match]\npattern = a\npattern = b\n"));
  ASSERT_EQ(tr.get_string("match", "pattern"), "b");
}

TEST(toml_malformed_lines) {
  TomlReader tr;
  ASSERT_FALSE(tr.load_string("[match]\njust words\n"));
  ASSERT_EQ(tr.error(), "line 2: expected key = value");
  ASSERT_FALSE(tr.has("match", "just words"));
  ASSERT_FALSE(tr.load_string("[match\n"));
  ASSERT_FALSE(tr.load_string("k = \"open\n"));
  ASSERT_FALSE(tr.load_string(" = 3\n"));
}
