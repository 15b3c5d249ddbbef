#include "cgsim/motion_model.hpp"
#include "cgsim/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <type_traits>

namespace cgsim {

namespace {
constexpr Real kEpsilon = 1e-9;

inline Real deg_to_rad(Real deg) noexcept {
  return deg * std::numbers::pi / 180.0;
}
} // namespace

Real wrap_degrees(Real deg) noexcept {
  Real w = std::fmod(deg, 360.0);
  if (w < 0.0) w += 360.0;
  if (w >= 360.0) w = 0.0; // fmod of a tiny negative can round up to 360
  return w;
}

Real snap_to_zero(Real v) noexcept {
  return (std::abs(v) < kEpsilon) ? 0.0 : v;
}

Cell heading_step(uint8_t theta) noexcept {
  switch (theta & 3u) {
    case 0: return Cell{1, 0};   // east
    case 1: return Cell{0, 1};   // north
    case 2: return Cell{-1, 0};  // west
    default: return Cell{0, -1}; // south
  }
}

GridState GridMotion::propose(const GridState& s, GridAction a) const noexcept {
  GridState n = s;
  switch (a) {
    case GridAction::Left:  n.x -= 1; break;
    case GridAction::Right: n.x += 1; break;
    case GridAction::Up:    n.y += 1; break;
    case GridAction::Down:  n.y -= 1; break;
    case GridAction::Beep:
    case GridAction::Nop:
      break;
  }
  return n;
}

RotaryState RotaryMotion::propose(const RotaryState& s, RotaryAction a) const noexcept {
  RotaryState n = s;
  const Cell d = heading_step(s.theta);
  switch (a) {
    case RotaryAction::TurnLeft:
      n.theta = static_cast<uint8_t>((s.theta + 1) % 4);
      break;
    case RotaryAction::TurnRight:
      n.theta = static_cast<uint8_t>((s.theta + 3) % 4);
      break;
    case RotaryAction::Forward:
      n.x += d.x;
      n.y += d.y;
      break;
    case RotaryAction::Backward:
      n.x -= d.x;
      n.y -= d.y;
      break;
    case RotaryAction::Beep:
    case RotaryAction::Nop:
      break;
  }
  return n;
}

ContinuousState ContinuousMotion::propose(const ContinuousState& s, ContinuousAction a) const noexcept {
  if (a == ContinuousAction::Beep || a == ContinuousAction::Nop) return s;

  ContinuousState n = s;

  // Euler step with the pre-step velocity and heading
  const Real rad = deg_to_rad(s.angle);
  n.x = s.x + s.velocity * snap_to_zero(std::cos(rad));
  n.y = s.y + s.velocity * snap_to_zero(std::sin(rad));

  switch (a) {
    case ContinuousAction::Accelerate:
      n.velocity = snap_to_zero(s.velocity + params.acceleration);
      break;
    case ContinuousAction::Decelerate:
      n.velocity = snap_to_zero(s.velocity - params.acceleration);
      break;
    case ContinuousAction::TurnLeft:
      n.angle = wrap_degrees(s.angle + params.angular_speed);
      break;
    case ContinuousAction::TurnRight:
      n.angle = wrap_degrees(s.angle - params.angular_speed);
      break;
    default:
      break;
  }
  n.velocity = std::clamp(n.velocity, params.min_velocity, params.max_velocity);
  return n;
}

KinematicState propose(const MotionModel& model, const KinematicState& state, const Action& action) {
  if (kind_of(model) != kind_of(state) || kind_of(model) != motion_of(action)) {
    throw InvalidAction(std::string("action for ") + std::string(to_string(motion_of(action))) +
                        " model given to " + std::string(to_string(kind_of(model))) + " agent");
  }
  if (encode_action(action) >= kActionCount) {
    throw InvalidAction("action code " + std::to_string(encode_action(action)) + " is not a " +
                        std::string(to_string(kind_of(model))) + " action");
  }

  return std::visit([&](const auto& m) -> KinematicState {
    using M = std::decay_t<decltype(m)>;

    if constexpr (std::is_same_v<M, GridMotion>) {
      return m.propose(std::get<GridState>(state), std::get<GridAction>(action));
    } else if constexpr (std::is_same_v<M, RotaryMotion>) {
      return m.propose(std::get<RotaryState>(state), std::get<RotaryAction>(action));
    } else {
      return m.propose(std::get<ContinuousState>(state), std::get<ContinuousAction>(action));
    }
  }, model);
}

Action decode_action(MotionKind kind, int code) {
  if (code < 0 || code >= kActionCount) {
    throw InvalidAction("action code " + std::to_string(code) + " outside [0, " +
                        std::to_string(kActionCount) + ") for " + std::string(to_string(kind)) + " agent");
  }
  const auto c = static_cast<uint8_t>(code);
  switch (kind) {
    case MotionKind::Grid:       return Action{static_cast<GridAction>(c)};
    case MotionKind::Rotary:     return Action{static_cast<RotaryAction>(c)};
    case MotionKind::Continuous: return Action{static_cast<ContinuousAction>(c)};
  }
  throw InvalidAction("unknown motion model");
}

int encode_action(const Action& a) noexcept {
  return std::visit([](auto x) { return static_cast<int>(x); }, a);
}

} // namespace cgsim
