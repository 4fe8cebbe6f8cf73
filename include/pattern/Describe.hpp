#pragma once

#include <string>
#include "pattern/Pattern.hpp"

namespace combre::pattern {

// Deterministic text form of a pattern tree, e.g.
// alt('0', seq('1', star([0-1]))). Not a parseable syntax.
[[nodiscard]] std::string describe(const Pattern& pattern);
[[nodiscard]] std::string describe(const Node& node);

} // namespace combre::pattern
