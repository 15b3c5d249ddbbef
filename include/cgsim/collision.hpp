#pragma once
#include <span>
#include <vector>

#include "cgsim/color_grid.hpp"
#include "cgsim/events.hpp"
#include "cgsim/kinematics.hpp"

namespace cgsim {

struct Resolution {
  std::vector<KinematicState> accepted;
  std::vector<StepEvent> events;  // moved / hit_boundary / blocked filled in
  uint32_t reverts{0};
};

// True when two agents may not hold these states at the same time:
// - two discrete agents: same cell;
// - discrete and continuous: same cell, or the continuous agent is closer
//   than `min_separation` to the centre of the discrete agent's cell;
// - two continuous agents: closer than `min_separation`.
bool in_conflict(const KinematicState& a, const KinematicState& b, Real min_separation) noexcept;

// Joint adjudication of all proposals for one step.
//
// 1. proposals outside the map revert to the current position (hit_boundary)
// 2. proposals onto a wall revert (blocked)
// 3. inter-agent conflicts are resolved to a fixpoint: a stationary agent
//    keeps its cell and the mover reverts; between two movers the lower
//    index keeps its proposal and the other reverts (blocked)
//
// Reverting restores position only, not the whole current state: rotary
// theta and continuous heading from the proposal survive, and continuous
// velocity drops to zero, as on a wall hit. An agent pushing into a wall
// can therefore still turn away on the same step.
class CollisionResolver {
public:
  CollisionResolver() = default;
  explicit CollisionResolver(Real min_separation) : min_separation_(min_separation) {}

  Resolution resolve(const ColorGrid& grid,
                     std::span<const KinematicState> current,
                     std::span<const KinematicState> proposed) const;

  Real min_separation() const noexcept { return min_separation_; }

private:
  Real min_separation_{0.5};

  static void revert(KinematicState& accepted, const KinematicState& current) noexcept;
};

} // namespace cgsim
