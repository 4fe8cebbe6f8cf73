#pragma once

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace combre::util {

// Flat TOML subset: [section] headers, key = value pairs, # comments,
// "quoted" strings. Nested tables and arrays are not supported.
class TomlReader {
public:
  // Returns false if the file cannot be opened or a line is malformed;
  // error() then says why.
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
      entries_.clear();
      error_ = "cannot open " + path;
      return false;
    }
    return parse(in);
  }

  bool load_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    return parse(in);
  }

  [[nodiscard]] const std::string& error() const { return error_; }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

private:
  struct Entry { std::string section, key, value; };

  std::vector<Entry> entries_;
  std::string error_;

  bool parse(std::istream& in) {
    entries_.clear();
    error_.clear();
    std::string section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[') {
        if (sv.back() != ']') return fail(lineno, "unterminated section header");
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) return fail(lineno, "expected key = value");
      std::string key(trim(sv.substr(0, eq)));
      if (key.empty()) return fail(lineno, "empty key");
      auto val = trim(sv.substr(eq + 1));
      if (!val.empty() && val.front() == '"') {
        if (val.size() < 2 || val.back() != '"') return fail(lineno, "unterminated string");
        val = val.substr(1, val.size() - 2);
      } else {
        // Trailing comment on an unquoted value
        auto hash = val.find('#');
        if (hash != std::string_view::npos) val = trim(val.substr(0, hash));
      }
      set(section, key, std::string(val));
    }
    return true;
  }

  bool fail(int lineno, const char* what) {
    error_ = "line " + std::to_string(lineno) + ": " + what;
    entries_.clear();
    return false;
  }

  void set(const std::string& section, const std::string& key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back({section, key, std::move(value)});
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return &e.value;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace combre::util
