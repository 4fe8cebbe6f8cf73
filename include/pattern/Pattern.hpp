#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pattern/ITrackingState.hpp"

namespace combre::pattern {

// Extension point for rules the built-in node kinds cannot express.
class ICombinator {
public:
  virtual ~ICombinator() = default;

  // Fresh state tracking the empty set of strings.
  [[nodiscard]] virtual std::unique_ptr<ITrackingState> make_state() const = 0;

  // Name used by describe()
  [[nodiscard]] virtual const char* name() const = 0;
};

struct CpRange { char32_t lo, hi; };

// Deepest nesting a pattern may have. Tracking, describe() and node
// teardown recurse once per level; construction past this throws
// std::invalid_argument.
inline constexpr size_t MAX_DEPTH = 4096;

enum class Kind : uint8_t {
    EMPTY,
    DOT,
    LITERAL,
    SET,
    SEQUENCE,
    ALTERNATION,
    ZERO_OR_MORE,
    OPTIONAL,
    CUSTOM,
};

// Immutable combinator tree node. Children are shared, so a sub-pattern can
// appear under several parents and in several patterns at once.
struct Node {
    Kind kind{Kind::EMPTY};
    char32_t ch{0};                           // LITERAL
    std::vector<CpRange> ranges;              // SET: sorted, merged, inclusive
    std::shared_ptr<const Node> left;         // SEQUENCE, ALTERNATION, ZERO_OR_MORE, OPTIONAL
    std::shared_ptr<const Node> right;        // SEQUENCE, ALTERNATION
    std::shared_ptr<const ICombinator> custom;

    // Static facts, computed once at construction. covers_any_char and
    // universal are sound under-approximations (false when unsure).
    bool nullable{false};         // matches ""
    bool covers_any_char{false};  // matches every one-character string
    bool universal{false};        // matches every string
    size_t size{1};               // nodes in this subtree
    size_t depth{1};              // levels in this subtree, at most MAX_DEPTH

    // Single-character predicate of DOT, LITERAL and SET.
    [[nodiscard]] bool test(char32_t c) const;
};

class Pattern {
public:
    explicit Pattern(std::shared_ptr<const Node> root);

    // Does the entire input match? Input is UTF-8; malformed bytes are
    // read as U+FFFD.
    [[nodiscard]] bool is_match(std::string_view input) const;
    [[nodiscard]] bool is_match(std::u32string_view input) const;

    [[nodiscard]] const Node& root() const { return *root_; }
    [[nodiscard]] const std::shared_ptr<const Node>& node() const { return root_; }
    [[nodiscard]] size_t size() const { return root_->size; }
    [[nodiscard]] size_t depth() const { return root_->depth; }
    [[nodiscard]] std::string describe() const;

private:
    std::shared_ptr<const Node> root_;
};

} // namespace combre::pattern
