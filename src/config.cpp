#include "cgsim/config.hpp"
#include "cgsim/collision.hpp"
#include "cgsim/errors.hpp"

#include <cmath>
#include <string>

namespace cgsim {

namespace {
std::string agent_tag(std::size_t i) {
  return "agent " + std::to_string(i) + ": ";
}

void validate_agent(const EnvironmentConfig& cfg, std::size_t i) {
  const AgentConfig& a = cfg.agents[i];
  const Position p = a.initial_position;

  if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
    throw ConfigurationError(agent_tag(i) + "initial position is not finite");
  }

  if (a.motion != MotionKind::Continuous) {
    if (p.x != std::floor(p.x) || p.y != std::floor(p.y)) {
      throw ConfigurationError(agent_tag(i) + "discrete agents need an integral initial position");
    }
  }

  if (!cfg.grid.is_inside(p.x, p.y)) {
    throw ConfigurationError(agent_tag(i) + "initial position (" + std::to_string(p.x) + ", " +
                             std::to_string(p.y) + ") is outside the " + std::to_string(cfg.grid.width()) +
                             "x" + std::to_string(cfg.grid.height()) + " grid");
  }
  const Cell c0 = cell_of(initial_state(a));
  if (cfg.grid.is_wall(c0.x, c0.y)) {
    throw ConfigurationError(agent_tag(i) + "initial position is on a wall");
  }

  if (a.motion == MotionKind::Rotary && a.initial_theta > 3) {
    throw ConfigurationError(agent_tag(i) + "initial theta must be in 0..3");
  }

  if (a.motion == MotionKind::Continuous) {
    const ContinuousParams& c = a.continuous;
    if (!(c.min_velocity < c.max_velocity)) {
      throw ConfigurationError(agent_tag(i) + "min_velocity must be below max_velocity");
    }
    if (a.initial_velocity < c.min_velocity || a.initial_velocity > c.max_velocity) {
      throw ConfigurationError(agent_tag(i) + "initial velocity outside [min_velocity, max_velocity]");
    }
    if (!(c.acceleration > 0.0) || !std::isfinite(c.acceleration)) {
      throw ConfigurationError(agent_tag(i) + "acceleration must be positive");
    }
    if (!(c.angular_speed > 0.0 && c.angular_speed < 360.0)) {
      throw ConfigurationError(agent_tag(i) + "angular_speed must be in (0, 360)");
    }
    if (!std::isfinite(a.initial_angle)) {
      throw ConfigurationError(agent_tag(i) + "initial angle is not finite");
    }
    if (a.angle_parts < 1 || a.angle_parts > 256) {
      throw ConfigurationError(agent_tag(i) + "angle_parts must be in 1..256");
    }
  }
}
} // namespace

KinematicState initial_state(const AgentConfig& a) {
  const Position p = a.initial_position;
  switch (a.motion) {
    case MotionKind::Grid:
      return GridState{static_cast<Coord>(p.x), static_cast<Coord>(p.y)};
    case MotionKind::Rotary:
      return RotaryState{static_cast<Coord>(p.x), static_cast<Coord>(p.y), a.initial_theta};
    case MotionKind::Continuous:
      return ContinuousState{p.x, p.y, a.initial_velocity, wrap_degrees(a.initial_angle)};
  }
  throw ConfigurationError("unknown motion model");
}

MotionModel make_motion_model(const AgentConfig& a) {
  switch (a.motion) {
    case MotionKind::Grid:       return GridMotion{};
    case MotionKind::Rotary:     return RotaryMotion{};
    case MotionKind::Continuous: return ContinuousMotion{a.continuous};
  }
  throw ConfigurationError("unknown motion model");
}

void validate(const EnvironmentConfig& cfg) {
  if (cfg.agents.empty()) throw ConfigurationError("at least one agent is required");

  if (!(cfg.min_separation > 0.0) || !std::isfinite(cfg.min_separation)) {
    throw ConfigurationError("min_separation must be positive");
  }

  const RewardConfig& r = cfg.rewards;
  if (!std::isfinite(r.reward_per_step) || !std::isfinite(r.reward_outside_grid) ||
      !std::isfinite(r.reward_duplicate_beep)) {
    throw ConfigurationError("reward values must be finite");
  }

  for (std::size_t i = 0; i < cfg.agents.size(); ++i) validate_agent(cfg, i);

  for (std::size_t i = 0; i < cfg.agents.size(); ++i) {
    for (std::size_t j = i + 1; j < cfg.agents.size(); ++j) {
      if (in_conflict(initial_state(cfg.agents[i]), initial_state(cfg.agents[j]), cfg.min_separation)) {
        throw ConfigurationError("agents " + std::to_string(i) + " and " + std::to_string(j) +
                                 " start in conflicting positions");
      }
    }
  }
}

} // namespace cgsim
