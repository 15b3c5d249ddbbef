#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "cgsim/config.hpp"
#include "cgsim/errors.hpp"
#include "cgsim/map_loader.hpp"
#include "cgsim/simulation_engine.hpp"

namespace {
// 4x3 with a wall at (1, 1)
cgsim::EnvironmentConfig base_config() {
  cgsim::AgentConfig a{};
  a.motion = cgsim::MotionKind::Grid;
  a.initial_position = {0.0, 0.0};

  cgsim::AgentConfig b{};
  b.motion = cgsim::MotionKind::Continuous;
  b.initial_position = {2.5, 2.5};

  return cgsim::EnvironmentConfig{cgsim::parse_map("rg  \n # b\n    \n"), {a, b}};
}
} // namespace

TEST(Config, DefaultsAreValid) {
  const auto cfg = base_config();
  EXPECT_NO_THROW(cgsim::validate(cfg));
  EXPECT_DOUBLE_EQ(cfg.rewards.reward_per_step, -0.01);
  EXPECT_DOUBLE_EQ(cfg.agents[1].continuous.angular_speed, 20.0);
  EXPECT_DOUBLE_EQ(cfg.agents[1].continuous.max_velocity, 0.20);
}

TEST(Config, RejectsMissingAgents) {
  auto cfg = base_config();
  cfg.agents.clear();
  EXPECT_THROW(cgsim::validate(cfg), cgsim::ConfigurationError);
}

TEST(Config, RejectsInitialPositionOutsideOrOnWall) {
  auto outside = base_config();
  outside.agents[0].initial_position = {4.0, 0.0};
  EXPECT_THROW(cgsim::validate(outside), cgsim::ConfigurationError);

  auto negative = base_config();
  negative.agents[1].initial_position = {-0.1, 1.0};
  EXPECT_THROW(cgsim::validate(negative), cgsim::ConfigurationError);

  auto wall = base_config();
  wall.agents[0].initial_position = {1.0, 1.0};
  EXPECT_THROW(cgsim::validate(wall), cgsim::ConfigurationError);
}

TEST(Config, RejectsFractionalDiscretePosition) {
  auto cfg = base_config();
  cfg.agents[0].initial_position = {0.5, 0.0};
  EXPECT_THROW(cgsim::validate(cfg), cgsim::ConfigurationError);
}

TEST(Config, RejectsDegenerateContinuousBounds) {
  auto equal = base_config();
  equal.agents[1].continuous.min_velocity = 0.2;
  equal.agents[1].continuous.max_velocity = 0.2;
  EXPECT_THROW(cgsim::validate(equal), cgsim::ConfigurationError);

  auto start = base_config();
  start.agents[1].initial_velocity = 0.5;
  EXPECT_THROW(cgsim::validate(start), cgsim::ConfigurationError);

  auto accel = base_config();
  accel.agents[1].continuous.acceleration = 0.0;
  EXPECT_THROW(cgsim::validate(accel), cgsim::ConfigurationError);

  auto turn = base_config();
  turn.agents[1].continuous.angular_speed = 360.0;
  EXPECT_THROW(cgsim::validate(turn), cgsim::ConfigurationError);

  auto no_sectors = base_config();
  no_sectors.agents[1].angle_parts = 0;
  EXPECT_THROW(cgsim::validate(no_sectors), cgsim::ConfigurationError);

  auto many_sectors = base_config();
  many_sectors.agents[1].angle_parts = 257;
  EXPECT_THROW(cgsim::validate(many_sectors), cgsim::ConfigurationError);
}

TEST(Config, RejectsOverlappingStartsAndBadScalars) {
  auto overlap = base_config();
  overlap.agents[1].initial_position = {0.2, 0.1};
  EXPECT_THROW(cgsim::validate(overlap), cgsim::ConfigurationError);

  // far corner of the grid agent's cell, more than 0.5 from its centre
  auto same_cell = base_config();
  same_cell.agents[1].initial_position = {0.9, 0.9};
  EXPECT_THROW(cgsim::validate(same_cell), cgsim::ConfigurationError);

  auto theta = base_config();
  theta.agents[0].motion = cgsim::MotionKind::Rotary;
  theta.agents[0].initial_theta = 4;
  EXPECT_THROW(cgsim::validate(theta), cgsim::ConfigurationError);

  auto sep = base_config();
  sep.min_separation = 0.0;
  EXPECT_THROW(cgsim::validate(sep), cgsim::ConfigurationError);

  auto reward = base_config();
  reward.rewards.reward_outside_grid = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(cgsim::validate(reward), cgsim::ConfigurationError);
}

TEST(Config, EngineConstructionValidates) {
  auto cfg = base_config();
  cfg.agents[0].initial_position = {9.0, 9.0};
  EXPECT_THROW(cgsim::SimulationEngine{cfg}, cgsim::ConfigurationError);
}
