#pragma once
#include <cstdint>

#include "cgsim/color_grid.hpp"
#include "cgsim/config.hpp"
#include "cgsim/events.hpp"
#include "cgsim/kinematics.hpp"
#include "cgsim/motion_model.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

// Per-agent snapshot handed back from reset() / step().
struct Observation {
  AgentIndex index{};
  MotionKind kind{MotionKind::Grid};

  Real x{};
  Real y{};
  Coord cell_x{};
  Coord cell_y{};

  uint8_t theta{0};   // rotary heading; continuous angle quantised to angle_parts sectors
  Real angle{0.0};    // continuous only
  Real velocity{0.0}; // continuous only

  bool beep{false};   // last action was a beep
  Color color{Color::Blank};
};

// Episode violation counters, cleared by reset().
struct AgentCounters {
  uint32_t boundary_hits{0};
  uint32_t blocked_moves{0};
  uint32_t duplicate_beeps{0};
  uint32_t first_visits{0};
};

class Agent {
public:
  // `grid` is owned by the engine and must outlive the agent.
  Agent(AgentIndex index, const AgentConfig& cfg, const ColorGrid& grid);

  AgentIndex index() const noexcept { return index_; }
  MotionKind kind() const noexcept { return kind_of(model_); }

  const KinematicState& state() const noexcept { return state_; }
  const KinematicState& initial_state() const noexcept { return initial_; }
  const MotionModel& motion() const noexcept { return model_; }

  bool last_beep() const noexcept { return last_beep_; }
  Color last_color() const noexcept { return last_color_; }
  const AgentCounters& counters() const noexcept { return counters_; }

  // Pure; throws InvalidAction for an action of another model.
  KinematicState propose(const Action& a) const { return cgsim::propose(model_, state_, a); }

  // The only mutation of agent state during a step.
  void commit(KinematicState accepted, const StepEvent& ev);

  void reset();

  Observation observe() const;

private:
  AgentIndex index_{0};
  MotionModel model_;
  KinematicState initial_;
  KinematicState state_;

  const ColorGrid* grid_{nullptr};
  uint16_t angle_parts_{4};

  bool last_beep_{false};
  Color last_color_{Color::Blank};
  AgentCounters counters_{};

  void refresh_color();
};

} // namespace cgsim
