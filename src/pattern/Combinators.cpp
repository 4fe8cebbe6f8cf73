#include "pattern/Combinators.hpp"
#include "util/Utf8.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace combre::pattern {

using NodePtr = std::shared_ptr<const Node>;

// ── Node construction ──────────────────────────────────────────────────

static Pattern finish(Node n) {
    const Node* a = n.left.get();
    const Node* b = n.right.get();
    switch (n.kind) {
        case Kind::EMPTY:
            n.nullable = true;
            break;
        case Kind::DOT:
            n.covers_any_char = true;
            break;
        case Kind::LITERAL:
        case Kind::SET:
        case Kind::CUSTOM:
            break;
        case Kind::SEQUENCE:
            n.nullable = a->nullable && b->nullable;
            n.covers_any_char = (a->covers_any_char && b->nullable)
                             || (a->nullable && b->covers_any_char);
            // s = s ++ "" or s = "" ++ s
            n.universal = (a->universal && b->nullable) || (a->nullable && b->universal);
            break;
        case Kind::ALTERNATION:
            n.nullable = a->nullable || b->nullable;
            n.covers_any_char = a->covers_any_char || b->covers_any_char;
            n.universal = a->universal || b->universal;
            break;
        case Kind::ZERO_OR_MORE:
            n.nullable = true;
            n.covers_any_char = a->covers_any_char;
            // Every string splits into one-character repetitions.
            n.universal = a->covers_any_char;
            break;
        case Kind::OPTIONAL:
            n.nullable = true;
            n.covers_any_char = a->covers_any_char;
            n.universal = a->universal;
            break;
    }
    n.covers_any_char = n.covers_any_char || n.universal;
    n.size = 1 + (a ? a->size : 0) + (b ? b->size : 0);
    n.depth = 1 + std::max(a ? a->depth : 0, b ? b->depth : 0);
    if (n.depth > MAX_DEPTH)
        throw std::invalid_argument("combre: pattern nested deeper than "
                                    + std::to_string(MAX_DEPTH) + " levels");
    return Pattern(std::make_shared<const Node>(std::move(n)));
}

static void require_scalar(char32_t cp, const char* fn) {
    if (!util::is_scalar_value(cp)) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "combre: %s: U+%04X is not a Unicode scalar value",
                      fn, (unsigned)cp);
        throw std::invalid_argument(buf);
    }
}

static std::u32string decode_or_throw(std::string_view utf8, const char* fn) {
    std::u32string out;
    if (!util::decode_utf8_string(utf8, out))
        throw std::invalid_argument(std::string("combre: ") + fn + ": malformed UTF-8 argument");
    return out;
}

// Sort by lo and merge overlapping or adjacent ranges.
static std::vector<CpRange> normalize(std::vector<CpRange> ranges) {
    std::sort(ranges.begin(), ranges.end(),
              [](const CpRange& x, const CpRange& y) { return x.lo < y.lo; });
    std::vector<CpRange> merged;
    for (auto& r : ranges) {
        if (!merged.empty() && r.lo <= merged.back().hi + 1)
            merged.back().hi = std::max(merged.back().hi, r.hi);
        else
            merged.push_back(r);
    }
    return merged;
}

static Pattern binary(Kind kind, const Pattern& a, const Pattern& b) {
    Node n;
    n.kind = kind;
    n.left = a.node();
    n.right = b.node();
    return finish(std::move(n));
}

static Pattern unary(Kind kind, const Pattern& a) {
    Node n;
    n.kind = kind;
    n.left = a.node();
    return finish(std::move(n));
}

static Pattern fold(Kind kind, std::initializer_list<Pattern> parts, const char* fn) {
    if (parts.size() == 0)
        throw std::invalid_argument(std::string("combre: ") + fn + ": needs at least one pattern");
    auto it = parts.begin();
    Pattern acc = *it++;
    for (; it != parts.end(); ++it)
        acc = binary(kind, acc, *it);
    return acc;
}

// ── Leaves ─────────────────────────────────────────────────────────────

Pattern empty() {
    return finish(Node{});
}

Pattern dot() {
    Node n;
    n.kind = Kind::DOT;
    return finish(std::move(n));
}

Pattern literal(char32_t ch) {
    require_scalar(ch, "literal");
    Node n;
    n.kind = Kind::LITERAL;
    n.ch = ch;
    return finish(std::move(n));
}

Pattern one_of(std::string_view utf8_chars) {
    return one_of(std::u32string_view(decode_or_throw(utf8_chars, "one_of")));
}

Pattern one_of(std::u32string_view chars) {
    std::vector<CpRange> ranges;
    ranges.reserve(chars.size());
    for (char32_t c : chars) {
        require_scalar(c, "one_of");
        ranges.push_back({c, c});
    }
    Node n;
    n.kind = Kind::SET;
    n.ranges = normalize(std::move(ranges));
    return finish(std::move(n));
}

Pattern range(char32_t lo, char32_t hi) {
    require_scalar(lo, "range");
    require_scalar(hi, "range");
    if (lo > hi)
        throw std::invalid_argument("combre: range: lower bound above upper bound");
    Node n;
    n.kind = Kind::SET;
    n.ranges.push_back({lo, hi});
    return finish(std::move(n));
}

// ── Composites ─────────────────────────────────────────────────────────

Pattern sequence(const Pattern& first, const Pattern& second) {
    return binary(Kind::SEQUENCE, first, second);
}

Pattern sequence(std::initializer_list<Pattern> parts) {
    return fold(Kind::SEQUENCE, parts, "sequence");
}

Pattern alternation(const Pattern& left, const Pattern& right) {
    return binary(Kind::ALTERNATION, left, right);
}

Pattern alternation(std::initializer_list<Pattern> choices) {
    return fold(Kind::ALTERNATION, choices, "alternation");
}

Pattern zero_or_more(const Pattern& p) {
    return unary(Kind::ZERO_OR_MORE, p);
}

Pattern one_or_more(const Pattern& p) {
    return sequence(p, zero_or_more(p));
}

Pattern optional(const Pattern& p) {
    return unary(Kind::OPTIONAL, p);
}

// Sequence is associative, so split in halves: depth grows with log(n).
static Pattern spell(const std::u32string& cps, size_t lo, size_t hi) {
    if (hi - lo == 1) return literal(cps[lo]);
    size_t mid = lo + (hi - lo) / 2;
    return sequence(spell(cps, lo, mid), spell(cps, mid, hi));
}

Pattern text(std::string_view utf8) {
    auto cps = decode_or_throw(utf8, "text");
    if (cps.empty()) return empty();
    return spell(cps, 0, cps.size());
}

Pattern custom(std::shared_ptr<const ICombinator> combinator) {
    if (!combinator)
        throw std::invalid_argument("combre: custom: null combinator");
    Node n;
    n.kind = Kind::CUSTOM;
    n.custom = std::move(combinator);
    return finish(std::move(n));
}

} // namespace combre::pattern
