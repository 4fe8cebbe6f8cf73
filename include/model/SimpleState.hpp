#pragma once

#include <cstdint>
#include "model/Accepts.hpp"

namespace combre::model {

// Tracking state of a single-character rule. Two bits of information:
// the empty string is tracked (Start, Both) and the previous character
// completed the rule (End, Both).
enum class SimpleState : uint8_t { Start, End, Both, Neither };

[[nodiscard]] constexpr SimpleState simple_start(SimpleState s) {
    switch (s) {
        case SimpleState::Neither:
        case SimpleState::Start:   return SimpleState::Start;
        case SimpleState::Both:
        case SimpleState::End:     return SimpleState::Both;
    }
    return SimpleState::Start;
}

// Only valid when the rule's predicate matched the character.
[[nodiscard]] constexpr SimpleState simple_advance(SimpleState s) {
    switch (s) {
        case SimpleState::Neither:
        case SimpleState::End:     return SimpleState::Neither;
        case SimpleState::Both:
        case SimpleState::Start:   return SimpleState::End;
    }
    return SimpleState::Neither;
}

[[nodiscard]] constexpr SimpleState simple_die(SimpleState) {
    return SimpleState::Neither;
}

// Neither cannot be left without an external start(), hence Never.
[[nodiscard]] constexpr Accepts simple_accepts(SimpleState s) {
    switch (s) {
        case SimpleState::End:
        case SimpleState::Both:    return Accepts::Yes;
        case SimpleState::Start:   return Accepts::No;
        case SimpleState::Neither: return Accepts::Never;
    }
    return Accepts::Never;
}

[[nodiscard]] constexpr const char* to_string(SimpleState s) {
    switch (s) {
        case SimpleState::Start:   return "Start";
        case SimpleState::End:     return "End";
        case SimpleState::Both:    return "Both";
        case SimpleState::Neither: return "Neither";
    }
    return "?";
}

} // namespace combre::model
