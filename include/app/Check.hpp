#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace combre::app {

// The combre-check command. args excludes the program name. Each INPUT (or
// each line of in when none is given) gets "match" or "no match" on out.
// Returns 0 when all matched, 1 when some did not, 2 on a usage error.
int run_check(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
              std::ostream& err);

void print_check_usage(std::ostream& os);

} // namespace combre::app
