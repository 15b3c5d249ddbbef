#include "cgsim/simulation_engine.hpp"
#include "cgsim/errors.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace cgsim {

namespace {
const EnvironmentConfig& checked(const EnvironmentConfig& cfg) {
  validate(cfg);
  return cfg;
}
} // namespace

SimulationEngine::SimulationEngine(EnvironmentConfig cfg)
  : grid_(checked(cfg).grid),
    policy_(cfg.rewards),
    resolver_(cfg.min_separation) {
  agents_.reserve(cfg.agents.size());
  for (std::size_t i = 0; i < cfg.agents.size(); ++i) {
    agents_.emplace_back(static_cast<AgentIndex>(i), cfg.agents[i], grid_);
  }

  spdlog::info("cgsim engine: {}x{} grid, {} painted cells, {} agent(s), {} rewards",
               grid_.width(), grid_.height(), grid_.painted_count(), agents_.size(),
               policy_.config().mode == RewardMode::Shared ? "shared" : "per-agent");
  for (const auto& a : agents_) {
    const Position p = position_of(a.state());
    spdlog::debug("  agent {} ({}) at ({}, {})", a.index(), to_string(a.kind()), p.x, p.y);
  }
}

std::vector<Observation> SimulationEngine::reset() {
  grid_.reset();
  for (auto& a : agents_) a.reset();
  step_ = 0;

  spdlog::info("cgsim engine: reset ({} agent(s))", agents_.size());
  return observe();
}

void SimulationEngine::apply_beeps(std::span<const Action> actions, Resolution& res) {
  // Ascending index: when two continuous agents share a fresh cell the
  // lower index gets the first visit.
  for (std::size_t i = 0; i < agents_.size(); ++i) {
    if (!is_beep(actions[i])) continue;

    auto& ev = res.events[i];
    const Cell c = cell_of(res.accepted[i]);
    const Color color = grid_.color_at(c);
    const bool first = grid_.mark_visited(c.x, c.y);

    ev.beeped = true;
    ev.first_visit = first;
    ev.duplicate_beep = !first && is_painted(color);
  }
}

StepResult SimulationEngine::step(std::span<const Action> actions) {
  if (actions.size() != agents_.size()) {
    throw InvalidAction("expected " + std::to_string(agents_.size()) + " action(s), got " +
                        std::to_string(actions.size()));
  }

  // 1. propose for every agent (throws before any state changes)
  std::vector<KinematicState> current;
  std::vector<KinematicState> proposed;
  current.reserve(agents_.size());
  proposed.reserve(agents_.size());
  for (std::size_t i = 0; i < agents_.size(); ++i) {
    current.push_back(agents_[i].state());
    proposed.push_back(agents_[i].propose(actions[i]));
  }

  // 2. joint resolution
  Resolution res = resolver_.resolve(grid_, current, proposed);

  // 3. beeps, strictly after movement is settled
  apply_beeps(actions, res);

  // 4. commit
  for (std::size_t i = 0; i < agents_.size(); ++i) {
    agents_[i].commit(std::move(res.accepted[i]), res.events[i]);
    if (res.events[i].hit_boundary) {
      spdlog::debug("step {}: agent {} hit the boundary", step_, i);
    } else if (res.events[i].blocked) {
      spdlog::debug("step {}: agent {} blocked", step_, i);
    }
  }
  step_++;

  // 5. rewards, 6. observations
  StepResult out{};
  out.rewards = policy_.score(res.events);
  out.events = std::move(res.events);
  out.observations = observe();
  out.done = false;
  out.info.step = step_;
  out.info.visited_cells = grid_.visited_count();
  out.info.reverts = res.reverts;

  spdlog::debug("step {}: {} revert(s), {}/{} painted cells visited",
                step_, res.reverts, grid_.visited_count(), grid_.painted_count());
  return out;
}

StepResult SimulationEngine::step_encoded(std::span<const int> codes) {
  if (codes.size() != agents_.size()) {
    throw InvalidAction("expected " + std::to_string(agents_.size()) + " action code(s), got " +
                        std::to_string(codes.size()));
  }

  std::vector<Action> actions;
  actions.reserve(codes.size());
  for (std::size_t i = 0; i < codes.size(); ++i) {
    actions.push_back(decode_action(agents_[i].kind(), codes[i]));
  }
  return step(actions);
}

std::vector<Observation> SimulationEngine::observe() const {
  std::vector<Observation> out;
  out.reserve(agents_.size());
  for (const auto& a : agents_) out.push_back(a.observe());
  return out;
}

Snapshot SimulationEngine::snapshot() const {
  Snapshot s{};
  s.width = grid_.width();
  s.height = grid_.height();
  s.step = step_;

  const auto n = static_cast<std::size_t>(s.width) * static_cast<std::size_t>(s.height);
  s.colors.reserve(n);
  s.visited.reserve(n);
  for (Coord y = 0; y < s.height; ++y) {
    for (Coord x = 0; x < s.width; ++x) {
      s.colors.push_back(grid_.color_at(x, y));
      s.visited.push_back(grid_.is_visited(x, y) ? 1 : 0);
    }
  }

  s.agents.reserve(agents_.size());
  for (const auto& a : agents_) s.agents.push_back(a.state());
  return s;
}

} // namespace cgsim
