#pragma once

#include <initializer_list>
#include <memory>
#include <string_view>

#include "pattern/Pattern.hpp"

namespace combre::pattern {

// Pattern construction. Every function returns a fresh immutable Pattern;
// arguments are shared, never copied. Invalid arguments throw
// std::invalid_argument here, never later during matching. That includes
// composites that would nest deeper than MAX_DEPTH.

// Matches only "".
[[nodiscard]] Pattern empty();

// Matches any single character.
[[nodiscard]] Pattern dot();

// Matches exactly ch. Throws if ch is not a Unicode scalar value.
[[nodiscard]] Pattern literal(char32_t ch);

// Matches one character from the set. The UTF-8 overload throws on
// malformed input; both throw on non-scalar values. An empty set matches
// nothing.
[[nodiscard]] Pattern one_of(std::string_view utf8_chars);
[[nodiscard]] Pattern one_of(std::u32string_view chars);

// Matches one character in [lo, hi]. Throws if lo > hi.
[[nodiscard]] Pattern range(char32_t lo, char32_t hi);

// Matches s1 ++ s2 where first matches s1 and second matches s2.
[[nodiscard]] Pattern sequence(const Pattern& first, const Pattern& second);
[[nodiscard]] Pattern sequence(std::initializer_list<Pattern> parts);

// Matches what either side matches.
[[nodiscard]] Pattern alternation(const Pattern& left, const Pattern& right);
[[nodiscard]] Pattern alternation(std::initializer_list<Pattern> choices);

[[nodiscard]] Pattern zero_or_more(const Pattern& p);
[[nodiscard]] Pattern one_or_more(const Pattern& p);
[[nodiscard]] Pattern optional(const Pattern& p);

// Sequence of literals spelling the UTF-8 string; empty() for "".
// Built as a balanced tree, so long strings stay shallow.
[[nodiscard]] Pattern text(std::string_view utf8);

// Wrap a user-defined rule. Throws on null.
[[nodiscard]] Pattern custom(std::shared_ptr<const ICombinator> combinator);

} // namespace combre::pattern
