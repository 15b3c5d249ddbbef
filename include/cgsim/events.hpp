#pragma once
#include <variant>

#include "cgsim/types.hpp"

namespace cgsim {

// Alternative order matches MotionKind.
using Action = std::variant<GridAction, RotaryAction, ContinuousAction>;

inline MotionKind motion_of(const Action& a) noexcept {
  return static_cast<MotionKind>(a.index()); // relies on variant order above
}

inline bool is_beep(const Action& a) noexcept {
  return std::visit([](auto x) { return x == decltype(x)::Beep; }, a);
}

// Raw integer code -> typed action for a given motion model. Throws InvalidAction.
Action decode_action(MotionKind kind, int code);

int encode_action(const Action& a) noexcept;

// Transient per-agent outcome of one step.
struct StepEvent {
  bool moved{false};
  bool hit_boundary{false};   // proposal left the map
  bool blocked{false};        // reverted by a wall or another agent
  bool beeped{false};
  bool duplicate_beep{false}; // beep on a painted cell already visited
  bool first_visit{false};    // beep that marked a painted cell for the first time
};

} // namespace cgsim
