#pragma once
#include <span>
#include <vector>

#include "cgsim/events.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

struct RewardConfig {
  Real reward_per_step{-0.01};       // added every step
  Real reward_outside_grid{-1.0};    // proposal left the map
  Real reward_duplicate_beep{-1.0};  // beep on an already visited painted cell

  RewardMode mode{RewardMode::PerAgent};
};

// Stateless: rewards depend only on this step's events.
class RewardPolicy {
public:
  RewardPolicy() = default;
  explicit RewardPolicy(RewardConfig cfg) : cfg_(cfg) {}

  Real score_one(const StepEvent& ev) const noexcept;

  // One reward per agent. In Shared mode every agent receives the team sum.
  std::vector<Real> score(std::span<const StepEvent> events) const;

  const RewardConfig& config() const noexcept { return cfg_; }
  RewardConfig& config_mut() noexcept { return cfg_; }

private:
  RewardConfig cfg_{};
};

} // namespace cgsim
