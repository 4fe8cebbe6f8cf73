#include "pattern/Describe.hpp"

#include <cstdio>

namespace combre::pattern {

// Printable ASCII as-is, everything else as U+XXXX.
static void append_char(std::string& out, char32_t c) {
    if (c >= 0x21 && c < 0x7F && c != '\'' && c != '\\' && c != '[' && c != ']' && c != '-') {
        out += (char)c;
        return;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", (unsigned)c);
    out += buf;
}

static void describe_into(const Node& n, std::string& out) {
    switch (n.kind) {
        case Kind::EMPTY:
            out += "empty";
            return;
        case Kind::DOT:
            out += '.';
            return;
        case Kind::LITERAL:
            out += '\'';
            append_char(out, n.ch);
            out += '\'';
            return;
        case Kind::SET:
            out += '[';
            for (const auto& r : n.ranges) {
                append_char(out, r.lo);
                if (r.hi != r.lo) {
                    out += '-';
                    append_char(out, r.hi);
                }
            }
            out += ']';
            return;
        case Kind::SEQUENCE:
        case Kind::ALTERNATION:
            out += n.kind == Kind::SEQUENCE ? "seq(" : "alt(";
            describe_into(*n.left, out);
            out += ", ";
            describe_into(*n.right, out);
            out += ')';
            return;
        case Kind::ZERO_OR_MORE:
            out += "star(";
            describe_into(*n.left, out);
            out += ')';
            return;
        case Kind::OPTIONAL:
            out += "opt(";
            describe_into(*n.left, out);
            out += ')';
            return;
        case Kind::CUSTOM:
            out += "custom:";
            out += n.custom->name();
            return;
    }
}

std::string describe(const Node& node) {
    std::string out;
    describe_into(node, out);
    return out;
}

std::string describe(const Pattern& pattern) {
    return describe(pattern.root());
}

} // namespace combre::pattern
