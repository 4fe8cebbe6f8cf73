#pragma once

#include <cstddef>
#include <string_view>

#include "model/Accepts.hpp"
#include "pattern/ITrackingState.hpp"
#include "pattern/Pattern.hpp"

namespace combre::pattern {

struct MatchOptions {
    bool short_circuit{true};  // stop at the first Always/Never
    bool trace{false};         // log every step to stderr
};

struct MatchResult {
    bool matched{false};
    size_t consumed{0};                          // characters fed before the verdict
    model::Accepts verdict{model::Accepts::Never};  // last answer of the state
};

// Full-match driver: start(), then advance() per character. With
// short_circuit the scan ends as soon as the answer is final; the boolean
// result is the same either way.
[[nodiscard]] MatchResult match(const Pattern& pattern, std::string_view utf8_input,
                                const MatchOptions& options = {});
[[nodiscard]] MatchResult match(const Pattern& pattern, std::u32string_view input,
                                const MatchOptions& options = {});

// Same protocol over a caller-supplied state, which must track the empty
// set on entry (freshly made or reset).
[[nodiscard]] MatchResult match_state(ITrackingState& state, std::u32string_view input,
                                      const MatchOptions& options = {});

[[nodiscard]] inline bool is_match(const Pattern& pattern, std::string_view utf8_input) {
    return match(pattern, utf8_input).matched;
}

[[nodiscard]] inline bool is_match(const Pattern& pattern, std::u32string_view input) {
    return match(pattern, input).matched;
}

} // namespace combre::pattern
