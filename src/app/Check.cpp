#include "app/Check.hpp"

#include "app/Config.hpp"
#include "pattern/Catalog.hpp"
#include "pattern/Matcher.hpp"

#include <filesystem>
#include <iostream>

namespace combre::app {

void print_check_usage(std::ostream& os) {
  os << "Usage: combre-check [-p NAME] [-c FILE] [--trace] [--no-short-circuit] [--list] [INPUT...]\n";
}

int run_check(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
              std::ostream& err) {
  std::string config_path = config_file_path();
  std::string pattern_override;
  int trace = -1, short_circuit = -1;   // -1: keep the configured value
  bool list = false;
  std::vector<std::string> inputs;

  const size_t n = args.size();
  for (size_t i = 0; i < n; ++i) {
    const std::string& a = args[i];
    if ((a == "-p" || a == "--pattern") && i + 1 < n) pattern_override = args[++i];
    else if ((a == "-c" || a == "--config") && i + 1 < n) {
      config_path = args[++i];
      std::error_code ec;
      if (!std::filesystem::exists(config_path, ec)) {
        err << "combre: check: config file " << config_path << " not found\n";
        return 2;
      }
    }
    else if (a == "--trace") trace = 1;
    else if (a == "--no-short-circuit") short_circuit = 0;
    else if (a == "--list") list = true;
    else if (a == "-h" || a == "--help") { print_check_usage(out); return 0; }
    else if (a == "--") { inputs.insert(inputs.end(), args.begin() + (long)i + 1, args.end()); break; }
    else if (a.size() > 1 && a[0] == '-') { print_check_usage(err); return 2; }
    else inputs.push_back(a);
  }

  if (list) {
    for (auto name : pattern::builtin_names()) out << name << "\n";
    return 0;
  }

  auto cfg = load_config(config_path);
  if (!pattern_override.empty()) cfg.pattern = pattern_override;
  if (trace >= 0) cfg.trace = trace == 1;
  if (short_circuit >= 0) cfg.short_circuit = short_circuit == 1;

  auto pattern = pattern::builtin(cfg.pattern);
  if (!pattern) {
    err << "combre: check: unknown pattern '" << cfg.pattern << "' (try --list)\n";
    return 2;
  }
  auto opts = to_match_options(cfg);
  if (cfg.trace)
    err << "combre: check: " << cfg.pattern << " = " << pattern->describe() << "\n";

  bool all = true;
  auto check = [&](const std::string& s) {
    auto r = pattern::match(*pattern, s, opts);
    out << (r.matched ? "match" : "no match") << "\n";
    all = all && r.matched;
  };

  if (inputs.empty()) {
    std::string line;
    while (std::getline(in, line)) check(line);
  } else {
    for (const auto& s : inputs) check(s);
  }
  return all ? 0 : 1;
}

} // namespace combre::app
