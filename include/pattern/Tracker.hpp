#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/Accepts.hpp"
#include "model/SimpleState.hpp"
#include "pattern/ITrackingState.hpp"
#include "pattern/Pattern.hpp"

namespace combre::pattern {

// Tracking state for a whole pattern tree.
// One slot per pattern node, laid out in pre-order in a single vector that is
// sized once at construction: a step never allocates, and costs
// O(size(pattern)): each slot is advanced once and started at most once.
// Each slot caches its own Accepts so that parents can query children in
// O(1).
class Tracker : public ITrackingState {
public:
    explicit Tracker(const Pattern& pattern);

    // Back to the empty tracking set, ready for another attempt.
    void reset();

    void start() override;
    void advance(char32_t ch) override;
    [[nodiscard]] model::Accepts accepts() const override { return slots_[0].acc; }
    [[nodiscard]] std::string debug_string() const override;

    [[nodiscard]] size_t slot_count() const { return slots_.size(); }

private:
    struct Slot {
        const Node* node{nullptr};
        model::SimpleState simple{model::SimpleState::Neither};  // DOT, LITERAL, SET
        bool init{false};               // EMPTY: "" tracked; ZERO_OR_MORE, OPTIONAL: zero-pass branch
        bool started{false};            // start() seen since the last advance()
        model::Accepts acc{model::Accepts::Never};
        int32_t a{-1};                  // first child slot
        int32_t b{-1};                  // second child slot
        std::unique_ptr<ITrackingState> custom;
    };

    int32_t build(const Node* n);
    void reset_slot(Slot& s);

    void start_at(int32_t i);
    void advance_at(int32_t i, char32_t ch);
    void refresh(int32_t i);
    void dump(int32_t i, std::string& out) const;

    std::shared_ptr<const Node> root_;
    std::vector<Slot> slots_;
};

} // namespace combre::pattern
