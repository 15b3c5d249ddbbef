#pragma once
#include <cstdint>
#include <vector>

#include "cgsim/color_grid.hpp"
#include "cgsim/kinematics.hpp"
#include "cgsim/motion_model.hpp"
#include "cgsim/reward_policy.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

struct AgentConfig {
  MotionKind motion{MotionKind::Grid};
  Position initial_position{};

  uint8_t initial_theta{0};     // rotary only, quarter turns from east

  // continuous only
  Real initial_angle{0.0};      // degrees
  Real initial_velocity{0.0};
  ContinuousParams continuous{};

  // Number of equal sectors the heading is quantised into for
  // Observation::theta, 1..256.
  uint16_t angle_parts{4};
};

struct EnvironmentConfig {
  ColorGrid grid;
  std::vector<AgentConfig> agents;
  RewardConfig rewards{};

  // Minimum distance between agents when at least one of them is continuous.
  Real min_separation{0.5};
};

// Throws ConfigurationError naming the first violated rule.
void validate(const EnvironmentConfig& cfg);

// Initial kinematic state an agent starts (and resets) to.
KinematicState initial_state(const AgentConfig& a);

MotionModel make_motion_model(const AgentConfig& a);

} // namespace cgsim
