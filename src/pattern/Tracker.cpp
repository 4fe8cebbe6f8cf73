#include "pattern/Tracker.hpp"

#include <stdexcept>

namespace combre::pattern {

using model::Accepts;
using model::SimpleState;

Tracker::Tracker(const Pattern& pattern) : root_(pattern.node()) {
    slots_.reserve(root_->size);
    build(root_.get());
    reset();
}

int32_t Tracker::build(const Node* n) {
    auto idx = (int32_t)slots_.size();
    slots_.emplace_back();
    slots_[idx].node = n;
    // Children are built after the parent; slots_ may reallocate, so
    // re-index instead of holding a reference across the recursion.
    if (n->left) {
        int32_t a = build(n->left.get());
        slots_[idx].a = a;
    }
    if (n->right) {
        int32_t b = build(n->right.get());
        slots_[idx].b = b;
    }
    return idx;
}

void Tracker::reset_slot(Slot& s) {
    s.simple = SimpleState::Neither;
    s.init = false;
    s.started = false;
    s.acc = Accepts::Never;
    // Custom rules have no reset hook; a fresh state is the empty set.
    if (s.node->kind == Kind::CUSTOM) {
        s.custom = s.node->custom->make_state();
        if (!s.custom)
            throw std::runtime_error(std::string("combre: Tracker: custom combinator '")
                                     + s.node->custom->name() + "' returned no state");
    }
}

void Tracker::reset() {
    for (auto& s : slots_)
        reset_slot(s);
    // Children come after parents, so refresh back to front.
    for (auto i = (int32_t)slots_.size() - 1; i >= 0; --i)
        refresh(i);
}

void Tracker::start() { start_at(0); }

void Tracker::advance(char32_t ch) { advance_at(0, ch); }

// ── Transitions ────────────────────────────────────────────────────────

void Tracker::start_at(int32_t i) {
    Slot& s = slots_[i];
    // "" is already tracked since the last advance: adding it again changes
    // nothing. Skipping keeps every slot to one start per step.
    if (s.started) return;
    s.started = true;
    switch (s.node->kind) {
        case Kind::EMPTY:
            s.init = true;
            break;
        case Kind::DOT:
        case Kind::LITERAL:
        case Kind::SET:
            s.simple = model::simple_start(s.simple);
            break;
        case Kind::SEQUENCE:
            // The second part only begins where the first could be finished.
            start_at(s.a);
            if (model::truthy(slots_[s.a].acc)) start_at(s.b);
            break;
        case Kind::ALTERNATION:
            start_at(s.a);
            start_at(s.b);
            break;
        case Kind::ZERO_OR_MORE:
        case Kind::OPTIONAL:
            s.init = true;
            start_at(s.a);
            break;
        case Kind::CUSTOM:
            s.custom->start();
            break;
    }
    refresh(i);
}

void Tracker::advance_at(int32_t i, char32_t ch) {
    Slot& s = slots_[i];
    s.started = false;
    switch (s.node->kind) {
        case Kind::EMPTY:
            s.init = false;
            break;
        case Kind::DOT:
        case Kind::LITERAL:
        case Kind::SET:
            s.simple = s.node->test(ch) ? model::simple_advance(s.simple)
                                        : model::simple_die(s.simple);
            break;
        case Kind::SEQUENCE:
            // Order matters: the second part consumes ch from its pre-step
            // state before the first part may restart it. Otherwise ch would
            // be both the last character of the first part and the first
            // character of the second.
            advance_at(s.b, ch);
            advance_at(s.a, ch);
            if (model::truthy(slots_[s.a].acc)) start_at(s.b);
            break;
        case Kind::ALTERNATION:
            advance_at(s.a, ch);
            advance_at(s.b, ch);
            break;
        case Kind::ZERO_OR_MORE:
            s.init = false;
            advance_at(s.a, ch);
            if (model::truthy(slots_[s.a].acc)) {
                // One repetition ends here: the next may begin, or we stop.
                start_at(s.a);
                s.init = true;
            }
            break;
        case Kind::OPTIONAL:
            s.init = false;
            advance_at(s.a, ch);
            break;
        case Kind::CUSTOM:
            s.custom->advance(ch);
            break;
    }
    refresh(i);
}

// Recompute the cached answer of slot i from its own fields and the cached
// answers of its children.
void Tracker::refresh(int32_t i) {
    Slot& s = slots_[i];
    switch (s.node->kind) {
        case Kind::EMPTY:
            // The tracked "" dies on any character, so never Always.
            s.acc = s.init ? Accepts::Yes : Accepts::Never;
            break;
        case Kind::DOT:
        case Kind::LITERAL:
        case Kind::SET:
            s.acc = model::simple_accepts(s.simple);
            break;
        case Kind::SEQUENCE: {
            Accepts second = slots_[s.b].acc;
            // A live first part can still restart a dead second part.
            if (second == Accepts::Never && slots_[s.a].acc != Accepts::Never)
                second = Accepts::No;
            s.acc = second;
            break;
        }
        case Kind::ALTERNATION:
            s.acc = model::combine(slots_[s.a].acc, slots_[s.b].acc);
            break;
        case Kind::ZERO_OR_MORE:
        case Kind::OPTIONAL:
            if (s.init)
                s.acc = model::combine(s.node->universal ? Accepts::Always : Accepts::Yes,
                                       slots_[s.a].acc);
            else
                s.acc = slots_[s.a].acc;
            break;
        case Kind::CUSTOM:
            s.acc = s.custom->accepts();
            break;
    }
}

// ── Diagnostics ────────────────────────────────────────────────────────

void Tracker::dump(int32_t i, std::string& out) const {
    const Slot& s = slots_[i];
    switch (s.node->kind) {
        case Kind::EMPTY:
            out += s.init ? "empty{live}" : "empty{dead}";
            return;
        case Kind::DOT:
        case Kind::LITERAL:
        case Kind::SET:
            out += model::to_string(s.simple);
            return;
        case Kind::SEQUENCE:
        case Kind::ALTERNATION:
            out += s.node->kind == Kind::SEQUENCE ? "seq(" : "alt(";
            dump(s.a, out);
            out += ", ";
            dump(s.b, out);
            out += ')';
            return;
        case Kind::ZERO_OR_MORE:
        case Kind::OPTIONAL:
            out += s.node->kind == Kind::ZERO_OR_MORE ? "star" : "opt";
            out += s.init ? "{init}(" : "(";
            dump(s.a, out);
            out += ')';
            return;
        case Kind::CUSTOM: {
            auto text = s.custom->debug_string();
            out += text.empty() ? model::to_string(s.acc) : text;
            return;
        }
    }
}

std::string Tracker::debug_string() const {
    std::string out;
    dump(0, out);
    return out;
}

} // namespace combre::pattern
