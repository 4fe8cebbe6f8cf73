#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "pattern/Pattern.hpp"

namespace combre::pattern {

// Prebuilt patterns, composed from the combinators.
//   binary         0|1[01]*
//   integer        -?(0|[1-9][0-9]*)
//   decimal        (0|[1-9][0-9]*)(\.[0-9]*)?
//   identifier     [A-Za-z_][A-Za-z0-9_]*
//   kernel_thread  \[.+\]
[[nodiscard]] std::optional<Pattern> builtin(std::string_view name);
[[nodiscard]] const std::vector<std::string_view>& builtin_names();

} // namespace combre::pattern
