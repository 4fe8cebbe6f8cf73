#include "pattern/Pattern.hpp"
#include "pattern/Describe.hpp"
#include "pattern/Matcher.hpp"

#include <algorithm>
#include <stdexcept>

namespace combre::pattern {

bool Node::test(char32_t c) const {
    switch (kind) {
        case Kind::DOT:
            return true;
        case Kind::LITERAL:
            return c == ch;
        case Kind::SET: {
            // First range whose upper bound is >= c
            auto it = std::lower_bound(ranges.begin(), ranges.end(), c,
                                       [](const CpRange& r, char32_t v) { return r.hi < v; });
            return it != ranges.end() && it->lo <= c;
        }
        default:
            return false;
    }
}

Pattern::Pattern(std::shared_ptr<const Node> root) : root_(std::move(root)) {
    if (!root_) throw std::invalid_argument("combre: Pattern: null root node");
}

bool Pattern::is_match(std::string_view input) const {
    return match(*this, input).matched;
}

bool Pattern::is_match(std::u32string_view input) const {
    return match(*this, input).matched;
}

std::string Pattern::describe() const {
    return pattern::describe(*this);
}

} // namespace combre::pattern
