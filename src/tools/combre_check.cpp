// Checks inputs against a named catalog pattern.
// Each INPUT (or each stdin line when none is given) gets "match" or
// "no match". Exit status: 0 all matched, 1 some did not, 2 usage error.

#include "app/Check.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return combre::app::run_check(args, std::cin, std::cout, std::cerr);
}
