#pragma once
#include <cstdint>
#include <span>
#include <vector>

#include "cgsim/agent.hpp"
#include "cgsim/collision.hpp"
#include "cgsim/color_grid.hpp"
#include "cgsim/config.hpp"
#include "cgsim/events.hpp"
#include "cgsim/reward_policy.hpp"

namespace cgsim {

struct StepInfo {
  StepIndex step{0};           // steps taken since the last reset
  uint32_t visited_cells{0};   // painted cells visited this episode
  uint32_t reverts{0};         // proposals undone by the resolver this step
};

struct StepResult {
  std::vector<Observation> observations;
  std::vector<Real> rewards;
  std::vector<StepEvent> events;
  bool done{false};            // episode limits belong to the caller
  StepInfo info{};
};

// Read-only copy of everything a renderer needs.
struct Snapshot {
  Coord width{0};
  Coord height{0};
  std::vector<Color> colors;     // row-major, y = 0 first
  std::vector<uint8_t> visited;  // same layout as colors
  std::vector<KinematicState> agents;
  StepIndex step{0};
};

// Owns the grid and the agents of one episode. Not thread-safe: callers must
// serialise reset()/step() per instance.
class SimulationEngine {
public:
  // Validates `cfg`; throws ConfigurationError.
  explicit SimulationEngine(EnvironmentConfig cfg);

  // Agents keep a pointer to grid_, so the engine stays put.
  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;

  std::vector<Observation> reset();

  // One action per agent, in agent order. Throws InvalidAction before
  // touching any state if an action does not belong to its agent's model.
  StepResult step(std::span<const Action> actions);

  // Same as step() with raw action codes 0..5.
  StepResult step_encoded(std::span<const int> codes);

  std::vector<Observation> observe() const;
  Snapshot snapshot() const;

  const ColorGrid& grid() const noexcept { return grid_; }
  const std::vector<Agent>& agents() const noexcept { return agents_; }
  std::size_t agent_count() const noexcept { return agents_.size(); }
  StepIndex steps() const noexcept { return step_; }

  const RewardPolicy& reward_policy() const noexcept { return policy_; }
  const CollisionResolver& resolver() const noexcept { return resolver_; }

private:
  ColorGrid grid_;
  std::vector<Agent> agents_;
  RewardPolicy policy_;
  CollisionResolver resolver_;
  StepIndex step_{0};

  void apply_beeps(std::span<const Action> actions, Resolution& res);
};

} // namespace cgsim
