#pragma once
#include <cstdint>
#include <functional>
#include <vector>

#include "cgsim/rng.hpp"
#include "cgsim/simulation_engine.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

struct RolloutStats {
  uint64_t steps{0};
  uint64_t beeps{0};
  uint64_t first_visits{0};
  uint64_t duplicate_beeps{0};
  uint64_t boundary_hits{0};
  uint64_t blocked{0};

  std::vector<Real> returns;   // undiscounted reward sum per agent
};

// Smoke-test driver: resets the engine and feeds uniformly random action
// codes for a fixed number of steps. Deterministic for a given seed.
class RandomRollout {
public:
  using StepHook = std::function<void(const SimulationEngine&, const StepResult&)>;

  explicit RandomRollout(uint64_t seed) : rng_(seed) {}

  RolloutStats run(SimulationEngine& engine, uint64_t steps, const StepHook& on_step = {});

private:
  Rng rng_;

  std::vector<int> sample_codes(std::size_t agents);
};

} // namespace cgsim
