#pragma once

#include <string>
#include "model/Accepts.hpp"

namespace combre::pattern {

// Mutable per-attempt state of a pattern. Conceptually it tracks the set of
// strings consumed since each start() that can still become a match.
// Custom combinators implement this together with ICombinator.
class ITrackingState {
public:
  virtual ~ITrackingState() = default;

  // Add the empty string to the tracked set.
  virtual void start() = 0;

  // Append ch to every tracked string, dropping those that cannot continue.
  virtual void advance(char32_t ch) = 0;

  // Does the tracked set contain a complete match?
  [[nodiscard]] virtual model::Accepts accepts() const = 0;

  // Optional: state dump for trace output
  [[nodiscard]] virtual std::string debug_string() const { return {}; }
};

} // namespace combre::pattern
