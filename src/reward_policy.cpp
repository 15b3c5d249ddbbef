#include "cgsim/reward_policy.hpp"

#include <algorithm>
#include <numeric>

namespace cgsim {

Real RewardPolicy::score_one(const StepEvent& ev) const noexcept {
  Real r = cfg_.reward_per_step;

  if (ev.hit_boundary) r += cfg_.reward_outside_grid;
  if (ev.duplicate_beep) r += cfg_.reward_duplicate_beep;

  return r;
}

std::vector<Real> RewardPolicy::score(std::span<const StepEvent> events) const {
  std::vector<Real> out;
  out.reserve(events.size());
  for (const auto& ev : events) out.push_back(score_one(ev));

  if (cfg_.mode == RewardMode::Shared) {
    const Real team = std::accumulate(out.begin(), out.end(), Real{0.0});
    std::fill(out.begin(), out.end(), team);
  }
  return out;
}

} // namespace cgsim
