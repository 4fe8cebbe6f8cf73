#include "pattern/Matcher.hpp"
#include "pattern/Tracker.hpp"
#include "util/Utf8.hpp"

#include <cstdio>

namespace combre::pattern {

using model::Accepts;

// Source: any type with done() and next() returning char32_t.
template <typename Source>
static MatchResult drive(ITrackingState& state, Source& src, const MatchOptions& opt) {
    MatchResult r;
    state.start();
    r.verdict = state.accepts();
    if (opt.trace) {
        std::fprintf(stderr, "combre: trace: start -> %s %s\n",
                     model::to_string(r.verdict), state.debug_string().c_str());
    }

    while (!src.done()) {
        char32_t ch = src.next();
        state.advance(ch);
        ++r.consumed;
        r.verdict = state.accepts();
        if (opt.trace) {
            std::fprintf(stderr, "combre: trace: step %zu U+%04X -> %s %s\n",
                         r.consumed, (unsigned)ch, model::to_string(r.verdict),
                         state.debug_string().c_str());
        }
        if (opt.short_circuit && model::is_final(r.verdict)) {
            if (opt.trace) {
                std::fprintf(stderr, "combre: trace: short-circuit after %zu characters\n",
                             r.consumed);
            }
            break;
        }
    }

    r.matched = model::truthy(r.verdict);
    return r;
}

namespace {

struct U32Source {
    std::u32string_view s;
    size_t pos{0};
    [[nodiscard]] bool done() const { return pos >= s.size(); }
    char32_t next() { return s[pos++]; }
};

} // namespace

MatchResult match(const Pattern& pattern, std::string_view utf8_input, const MatchOptions& options) {
    Tracker state(pattern);
    util::Utf8Cursor src(utf8_input);
    return drive(state, src, options);
}

MatchResult match(const Pattern& pattern, std::u32string_view input, const MatchOptions& options) {
    Tracker state(pattern);
    U32Source src{input};
    return drive(state, src, options);
}

MatchResult match_state(ITrackingState& state, std::u32string_view input, const MatchOptions& options) {
    U32Source src{input};
    return drive(state, src, options);
}

} // namespace combre::pattern
