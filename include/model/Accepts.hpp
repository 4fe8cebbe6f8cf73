#pragma once

#include <cstdint>

namespace combre::model {

// Answer of a tracking state. Yes/No can change on the next character;
// Always/Never hold for every possible continuation of the input.
enum class Accepts : uint8_t { Yes, No, Always, Never };

// Always absorbs, Never is the identity, Yes dominates No.
[[nodiscard]] constexpr Accepts combine(Accepts a, Accepts b) {
    if (a == Accepts::Always || b == Accepts::Always) return Accepts::Always;
    if (a == Accepts::Yes || b == Accepts::Yes) return Accepts::Yes;
    if (a == Accepts::No || b == Accepts::No) return Accepts::No;
    return Accepts::Never;
}

[[nodiscard]] constexpr bool truthy(Accepts a) {
    return a == Accepts::Yes || a == Accepts::Always;
}

// Stable for the rest of the input: the driver may stop here.
[[nodiscard]] constexpr bool is_final(Accepts a) {
    return a == Accepts::Always || a == Accepts::Never;
}

[[nodiscard]] constexpr const char* to_string(Accepts a) {
    switch (a) {
        case Accepts::Yes:    return "Yes";
        case Accepts::No:     return "No";
        case Accepts::Always: return "Always";
        case Accepts::Never:  return "Never";
    }
    return "?";
}

} // namespace combre::model
