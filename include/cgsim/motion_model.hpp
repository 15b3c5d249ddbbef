#pragma once
#include <variant>

#include "cgsim/events.hpp"
#include "cgsim/kinematics.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

// Motion models are pure: they know nothing about the map and never clamp
// to its bounds. Bounds, walls and other agents are CollisionResolver's job.

struct GridMotion {
  GridState propose(const GridState& s, GridAction a) const noexcept;
};

struct RotaryMotion {
  RotaryState propose(const RotaryState& s, RotaryAction a) const noexcept;
};

struct ContinuousParams {
  Real min_velocity{0.0};
  Real max_velocity{0.20};
  Real acceleration{0.02};
  Real angular_speed{20.0};  // degrees per turn action
};

// Discrete-time point mass: displacement uses the velocity and heading held
// before this step; turn/accelerate changes show up in the next step.
struct ContinuousMotion {
  ContinuousParams params{};

  ContinuousState propose(const ContinuousState& s, ContinuousAction a) const noexcept;
};

// Alternative order matches MotionKind.
using MotionModel = std::variant<GridMotion, RotaryMotion, ContinuousMotion>;

inline MotionKind kind_of(const MotionModel& m) noexcept {
  return static_cast<MotionKind>(m.index());
}

// Dispatches on the model. Throws InvalidAction when the state or action
// belongs to a different model.
KinematicState propose(const MotionModel& model, const KinematicState& state, const Action& action);

// Wraps any angle in degrees into [0, 360).
Real wrap_degrees(Real deg) noexcept;

// Rounds values within 1e-9 of zero to exactly zero.
Real snap_to_zero(Real v) noexcept;

// Unit displacement for a rotary heading.
Cell heading_step(uint8_t theta) noexcept;

} // namespace cgsim
