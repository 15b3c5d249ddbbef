#include "cgsim/rollout.hpp"

namespace cgsim {

std::vector<int> RandomRollout::sample_codes(std::size_t agents) {
  std::vector<int> codes;
  codes.reserve(agents);
  for (std::size_t i = 0; i < agents; ++i) codes.push_back(rng_.uniform_int(0, kActionCount - 1));
  return codes;
}

RolloutStats RandomRollout::run(SimulationEngine& engine, uint64_t steps, const StepHook& on_step) {
  RolloutStats stats{};
  stats.returns.assign(engine.agent_count(), 0.0);

  (void)engine.reset();

  for (uint64_t t = 0; t < steps; ++t) {
    const auto codes = sample_codes(engine.agent_count());
    const StepResult res = engine.step_encoded(codes);
    stats.steps++;

    for (std::size_t i = 0; i < res.events.size(); ++i) {
      const auto& ev = res.events[i];
      if (ev.beeped) stats.beeps++;
      if (ev.first_visit) stats.first_visits++;
      if (ev.duplicate_beep) stats.duplicate_beeps++;
      if (ev.hit_boundary) stats.boundary_hits++;
      if (ev.blocked) stats.blocked++;
      stats.returns[i] += res.rewards[i];
    }

    if (on_step) on_step(engine, res);
  }

  return stats;
}

} // namespace cgsim
