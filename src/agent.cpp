#include "cgsim/agent.hpp"

#include <cmath>
#include <utility>

namespace cgsim {

Agent::Agent(AgentIndex index, const AgentConfig& cfg, const ColorGrid& grid)
  : index_(index),
    model_(make_motion_model(cfg)),
    initial_(cgsim::initial_state(cfg)),
    state_(initial_),
    grid_(&grid),
    angle_parts_(cfg.angle_parts) {
  refresh_color();
}

void Agent::refresh_color() {
  // committed states are always inside the grid
  last_color_ = grid_->color_at(cell_of(state_));
}

void Agent::commit(KinematicState accepted, const StepEvent& ev) {
  state_ = std::move(accepted);
  last_beep_ = ev.beeped;

  if (ev.hit_boundary) counters_.boundary_hits++;
  if (ev.blocked) counters_.blocked_moves++;
  if (ev.duplicate_beep) counters_.duplicate_beeps++;
  if (ev.first_visit) counters_.first_visits++;

  refresh_color();
}

void Agent::reset() {
  state_ = initial_;
  last_beep_ = false;
  counters_ = AgentCounters{};
  refresh_color();
}

Observation Agent::observe() const {
  Observation o{};
  o.index = index_;
  o.kind = kind();

  const Position p = position_of(state_);
  const Cell c = cell_of(state_);
  o.x = p.x;
  o.y = p.y;
  o.cell_x = c.x;
  o.cell_y = c.y;

  if (const auto* r = std::get_if<RotaryState>(&state_)) {
    o.theta = r->theta;
  } else if (const auto* k = std::get_if<ContinuousState>(&state_)) {
    o.angle = k->angle;
    o.velocity = k->velocity;
    const Real sector = 360.0 / static_cast<Real>(angle_parts_);
    o.theta = static_cast<uint8_t>(static_cast<int>(std::floor(k->angle / sector)) % angle_parts_);
  }

  o.beep = last_beep_;
  o.color = last_color_;
  return o;
}

} // namespace cgsim
