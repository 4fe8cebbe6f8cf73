#include "pattern/Catalog.hpp"
#include "pattern/Combinators.hpp"

namespace combre::pattern {

static Pattern digits() {
    return zero_or_more(range('0', '9'));
}

// 0 | [1-9][0-9]*
static Pattern natural() {
    return alternation(literal('0'), sequence(range('1', '9'), digits()));
}

static Pattern make_binary() {
    return alternation(literal('0'), sequence(literal('1'), zero_or_more(one_of("01"))));
}

static Pattern make_integer() {
    return sequence(optional(literal('-')), natural());
}

static Pattern make_decimal() {
    return sequence(natural(), optional(sequence(literal('.'), digits())));
}

static Pattern make_identifier() {
    auto head = alternation({range('A', 'Z'), range('a', 'z'), literal('_')});
    auto tail = alternation(head, range('0', '9'));
    return sequence(head, zero_or_more(tail));
}

static Pattern make_kernel_thread() {
    return sequence({literal('['), one_or_more(dot()), literal(']')});
}

struct CatalogEntry { std::string_view name; Pattern (*make)(); };

static constexpr CatalogEntry entries[] = {
    {"binary",        make_binary},
    {"integer",       make_integer},
    {"decimal",       make_decimal},
    {"identifier",    make_identifier},
    {"kernel_thread", make_kernel_thread},
};

std::optional<Pattern> builtin(std::string_view name) {
    for (const auto& e : entries)
        if (e.name == name) return e.make();
    return std::nullopt;
}

const std::vector<std::string_view>& builtin_names() {
    static const std::vector<std::string_view> names = [] {
        std::vector<std::string_view> v;
        for (const auto& e : entries) v.push_back(e.name);
        return v;
    }();
    return names;
}

} // namespace combre::pattern
