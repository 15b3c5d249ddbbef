#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "cgsim/errors.hpp"
#include "cgsim/map_loader.hpp"
#include "cgsim/rollout.hpp"
#include "cgsim/simulation_engine.hpp"

namespace {
cgsim::ColorGrid blank_grid(int w, int h) {
  std::vector<std::vector<cgsim::Color>> rows(static_cast<std::size_t>(h),
                                              std::vector<cgsim::Color>(static_cast<std::size_t>(w), cgsim::Color::Blank));
  return cgsim::ColorGrid(std::move(rows));
}

cgsim::AgentConfig agent(cgsim::MotionKind kind, double x, double y) {
  cgsim::AgentConfig a{};
  a.motion = kind;
  a.initial_position = {x, y};
  return a;
}

cgsim::RewardConfig test_rewards() {
  cgsim::RewardConfig r{};
  r.reward_per_step = -0.01;
  r.reward_outside_grid = -1.0;
  r.reward_duplicate_beep = -0.5;
  return r;
}

cgsim::StepResult step1(cgsim::SimulationEngine& eng, cgsim::Action a) {
  const std::vector<cgsim::Action> actions{a};
  return eng.step(actions);
}
} // namespace

TEST(SimulationEngine, GridAgentRightRightUpEndsAtThreeTwo) {
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 1, 1)}, test_rewards()}};
  (void)eng.reset();

  cgsim::StepResult res;
  for (auto a : {cgsim::GridAction::Right, cgsim::GridAction::Right, cgsim::GridAction::Up}) {
    res = step1(eng, a);
    EXPECT_FALSE(res.events[0].hit_boundary);
    EXPECT_TRUE(res.events[0].moved);
    EXPECT_DOUBLE_EQ(res.rewards[0], -0.01);
  }

  EXPECT_EQ(std::get<cgsim::GridState>(eng.agents()[0].state()), (cgsim::GridState{3, 2}));
  EXPECT_EQ(res.observations[0].cell_x, 3);
  EXPECT_EQ(res.observations[0].cell_y, 2);
  EXPECT_EQ(eng.agents()[0].counters().boundary_hits, 0u);
  EXPECT_FALSE(res.done);
  EXPECT_EQ(res.info.step, 3u);
}

TEST(SimulationEngine, RotaryAgentForwardTurnForward) {
  auto a = agent(cgsim::MotionKind::Rotary, 1, 1);
  a.initial_theta = 0; // east
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {a}}};

  auto res = step1(eng, cgsim::RotaryAction::Forward);
  EXPECT_EQ(std::get<cgsim::RotaryState>(eng.agents()[0].state()), (cgsim::RotaryState{2, 1, 0}));

  res = step1(eng, cgsim::RotaryAction::TurnLeft);
  EXPECT_FALSE(res.events[0].moved);

  res = step1(eng, cgsim::RotaryAction::Forward);
  EXPECT_EQ(std::get<cgsim::RotaryState>(eng.agents()[0].state()), (cgsim::RotaryState{2, 2, 1}));
  EXPECT_EQ(res.observations[0].theta, 1);
}

TEST(SimulationEngine, SecondBeepOnColoredCellIsDuplicate) {
  cgsim::SimulationEngine eng{{cgsim::parse_map("   \n r \n   \n"),
                               {agent(cgsim::MotionKind::Grid, 1, 1)}, test_rewards()}};

  auto first = step1(eng, cgsim::GridAction::Beep);
  EXPECT_TRUE(first.events[0].beeped);
  EXPECT_TRUE(first.events[0].first_visit);
  EXPECT_FALSE(first.events[0].duplicate_beep);
  EXPECT_DOUBLE_EQ(first.rewards[0], -0.01);
  EXPECT_TRUE(first.observations[0].beep);
  EXPECT_EQ(first.observations[0].color, cgsim::Color::Red);
  EXPECT_EQ(first.info.visited_cells, 1u);

  auto second = step1(eng, cgsim::GridAction::Beep);
  EXPECT_TRUE(second.events[0].beeped);
  EXPECT_TRUE(second.events[0].duplicate_beep);
  EXPECT_DOUBLE_EQ(second.rewards[0], -0.01 + -0.5);
  EXPECT_EQ(eng.agents()[0].counters().duplicate_beeps, 1u);

  auto after = step1(eng, cgsim::GridAction::Nop);
  EXPECT_FALSE(after.observations[0].beep);
}

TEST(SimulationEngine, BeepOnBlankCellIsNeutral) {
  cgsim::SimulationEngine eng{{blank_grid(3, 3), {agent(cgsim::MotionKind::Grid, 1, 1)}, test_rewards()}};

  for (int i = 0; i < 2; ++i) {
    auto res = step1(eng, cgsim::GridAction::Beep);
    EXPECT_TRUE(res.events[0].beeped);
    EXPECT_FALSE(res.events[0].first_visit);
    EXPECT_FALSE(res.events[0].duplicate_beep);
    EXPECT_DOUBLE_EQ(res.rewards[0], -0.01);
  }
  EXPECT_FALSE(eng.grid().is_visited(1, 1));
}

TEST(SimulationEngine, LeftAtOriginHitsBoundary) {
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 0, 0)}, test_rewards()}};

  auto res = step1(eng, cgsim::GridAction::Left);
  EXPECT_EQ(std::get<cgsim::GridState>(eng.agents()[0].state()), (cgsim::GridState{0, 0}));
  EXPECT_TRUE(res.events[0].hit_boundary);
  EXPECT_FALSE(res.events[0].moved);
  EXPECT_DOUBLE_EQ(res.rewards[0], -0.01 + -1.0);
  EXPECT_EQ(eng.agents()[0].counters().boundary_hits, 1u);
}

TEST(SimulationEngine, ContinuousAgentStopsAtBoundary) {
  auto a = agent(cgsim::MotionKind::Continuous, 4.5, 2.0);
  a.continuous.acceleration = 0.5;
  a.continuous.max_velocity = 1.0;
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {a}, test_rewards()}};

  // speed takes effect one step later
  auto res = step1(eng, cgsim::ContinuousAction::Accelerate);
  EXPECT_FALSE(res.events[0].moved);
  EXPECT_DOUBLE_EQ(res.observations[0].velocity, 0.5);

  res = step1(eng, cgsim::ContinuousAction::Accelerate);
  EXPECT_TRUE(res.events[0].hit_boundary);
  EXPECT_DOUBLE_EQ(res.observations[0].x, 4.5);
  EXPECT_DOUBLE_EQ(res.observations[0].velocity, 0.0);
  EXPECT_EQ(res.observations[0].cell_x, 4);
}

TEST(SimulationEngine, LowerIndexWinsAcrossRepeatedRuns) {
  const std::vector<cgsim::Action> actions{cgsim::GridAction::Right, cgsim::RotaryAction::Forward};

  for (int run = 0; run < 2; ++run) {
    auto b = agent(cgsim::MotionKind::Rotary, 3, 2);
    b.initial_theta = 2; // west
    cgsim::SimulationEngine eng{{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 1, 2), b}}};

    const auto res = eng.step(actions);
    EXPECT_EQ(res.observations[0].cell_x, 2);
    EXPECT_EQ(res.observations[1].cell_x, 3);
    EXPECT_TRUE(res.events[1].blocked);
    EXPECT_EQ(res.info.reverts, 1u);
  }
}

TEST(SimulationEngine, ResetRestoresInitialStateAndClearsVisits) {
  auto c = agent(cgsim::MotionKind::Continuous, 3.0, 1.0);
  c.initial_velocity = 0.1;
  cgsim::SimulationEngine eng{{cgsim::parse_map("rgbyp\nrgbyp\nrgbyp\n"),
                               {agent(cgsim::MotionKind::Grid, 0, 0), c}}};

  cgsim::RandomRollout rollout(7);
  (void)rollout.run(eng, 200);
  const std::vector<cgsim::Action> beeps{cgsim::GridAction::Beep, cgsim::ContinuousAction::Beep};
  (void)eng.step(beeps);
  ASSERT_GT(eng.grid().visited_count(), 0u);

  const auto obs = eng.reset();

  EXPECT_EQ(eng.grid().visited_count(), 0u);
  for (cgsim::Coord y = 0; y < eng.grid().height(); ++y) {
    for (cgsim::Coord x = 0; x < eng.grid().width(); ++x) EXPECT_FALSE(eng.grid().is_visited(x, y));
  }
  for (const auto& a : eng.agents()) {
    EXPECT_EQ(a.state(), a.initial_state());
    EXPECT_FALSE(a.last_beep());
    EXPECT_EQ(a.counters().duplicate_beeps, 0u);
    EXPECT_EQ(a.counters().boundary_hits, 0u);
  }
  EXPECT_EQ(eng.steps(), 0u);
  EXPECT_DOUBLE_EQ(obs[1].velocity, 0.1);
  EXPECT_EQ(obs[0].color, cgsim::Color::Red);
}

TEST(SimulationEngine, AgentsStayInsideUnderRandomActions) {
  auto c = agent(cgsim::MotionKind::Continuous, 2.0, 2.0);
  c.continuous.max_velocity = 0.8;
  c.continuous.min_velocity = -0.8;
  c.continuous.acceleration = 0.3;
  cgsim::SimulationEngine eng{{cgsim::parse_map(cgsim::default_map()),
                               {agent(cgsim::MotionKind::Grid, 0, 0),
                                agent(cgsim::MotionKind::Rotary, 6, 4), c}}};

  cgsim::RandomRollout rollout(123);
  const auto stats = rollout.run(eng, 2000, [](const cgsim::SimulationEngine& e, const cgsim::StepResult& res) {
    for (const auto& a : e.agents()) {
      const auto p = cgsim::position_of(a.state());
      ASSERT_TRUE(e.grid().is_inside(p.x, p.y));
      ASSERT_FALSE(e.grid().is_wall(cgsim::cell_of(a.state()).x, cgsim::cell_of(a.state()).y));
    }
    for (std::size_t i = 0; i < e.agent_count(); ++i) {
      for (std::size_t j = i + 1; j < e.agent_count(); ++j) {
        EXPECT_FALSE(cgsim::in_conflict(e.agents()[i].state(), e.agents()[j].state(), 0.5));
      }
    }
    EXPECT_FALSE(res.done);
  });
  EXPECT_EQ(stats.steps, 2000u);
  EXPECT_GT(stats.boundary_hits, 0u);
}

TEST(SimulationEngine, RejectsContinuousStartInsideGridAgentCell) {
  auto c = agent(cgsim::MotionKind::Continuous, 2.7, 2.7);
  const cgsim::EnvironmentConfig shared_cell{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 2, 2), c}};
  EXPECT_THROW(cgsim::SimulationEngine{shared_cell}, cgsim::ConfigurationError);

  c.initial_position = {1.7, 1.7};
  const cgsim::EnvironmentConfig neighbours{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 2, 2), c}};
  EXPECT_NO_THROW(cgsim::SimulationEngine{neighbours});
}

TEST(SimulationEngine, DiscreteAgentsNeverShareACell) {
  auto fast = agent(cgsim::MotionKind::Continuous, 0.5, 0.5);
  fast.continuous.min_velocity = -0.6;
  fast.continuous.max_velocity = 0.6;
  fast.continuous.acceleration = 0.3;
  auto slow = agent(cgsim::MotionKind::Continuous, 2.5, 2.5);
  cgsim::SimulationEngine eng{{blank_grid(4, 4),
                               {agent(cgsim::MotionKind::Grid, 3, 0), fast,
                                agent(cgsim::MotionKind::Rotary, 0, 3), slow}}};

  cgsim::RandomRollout rollout(31);
  (void)rollout.run(eng, 3000, [](const cgsim::SimulationEngine& e, const cgsim::StepResult&) {
    const auto& agents = e.agents();
    for (std::size_t i = 0; i < agents.size(); ++i) {
      for (std::size_t j = i + 1; j < agents.size(); ++j) {
        if (agents[i].kind() == cgsim::MotionKind::Continuous &&
            agents[j].kind() == cgsim::MotionKind::Continuous) continue;
        ASSERT_FALSE(cgsim::cell_of(agents[i].state()) == cgsim::cell_of(agents[j].state()))
          << "agents " << i << " and " << j << " at step " << e.steps();
      }
    }
  });
}

TEST(SimulationEngine, InvalidActionLeavesStateUntouched) {
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 1, 1),
                                                  agent(cgsim::MotionKind::Rotary, 3, 3)}}};

  const std::vector<cgsim::Action> wrong{cgsim::GridAction::Right, cgsim::GridAction::Up};
  EXPECT_THROW((void)eng.step(wrong), cgsim::InvalidAction);

  const std::vector<cgsim::Action> short_list{cgsim::GridAction::Right};
  EXPECT_THROW((void)eng.step(short_list), cgsim::InvalidAction);

  const std::vector<int> bad_code{0, 7};
  EXPECT_THROW((void)eng.step_encoded(bad_code), cgsim::InvalidAction);

  EXPECT_EQ(std::get<cgsim::GridState>(eng.agents()[0].state()), (cgsim::GridState{1, 1}));
  EXPECT_EQ(eng.steps(), 0u);
}

TEST(SimulationEngine, StepEncodedDecodesPerAgentModel) {
  cgsim::SimulationEngine eng{{blank_grid(5, 5), {agent(cgsim::MotionKind::Grid, 1, 1),
                                                  agent(cgsim::MotionKind::Rotary, 3, 3)}}};

  const std::vector<int> codes{2, 1}; // grid Right, rotary Forward (east)
  const auto res = eng.step_encoded(codes);
  EXPECT_EQ(res.observations[0].cell_x, 2);
  EXPECT_EQ(res.observations[1].cell_x, 4);
}

TEST(SimulationEngine, ContinuousThetaUsesConfiguredSectors) {
  auto quarters = agent(cgsim::MotionKind::Continuous, 0.5, 0.5);
  quarters.initial_angle = 100.0;
  auto eighths = agent(cgsim::MotionKind::Continuous, 3.5, 3.5);
  eighths.initial_angle = 100.0;
  eighths.angle_parts = 8;
  auto single = agent(cgsim::MotionKind::Continuous, 0.5, 3.5);
  single.initial_angle = 359.0;
  single.angle_parts = 1;

  cgsim::SimulationEngine eng{{blank_grid(5, 5), {quarters, eighths, single}}};
  const auto obs = eng.observe();
  EXPECT_EQ(obs[0].theta, 1);
  EXPECT_EQ(obs[1].theta, 2);
  EXPECT_EQ(obs[2].theta, 0);
  EXPECT_DOUBLE_EQ(obs[1].angle, 100.0);
}

TEST(SimulationEngine, SnapshotCopiesGridAndAgents) {
  cgsim::SimulationEngine eng{{cgsim::parse_map("r#\n  \n"), {agent(cgsim::MotionKind::Grid, 0, 1)}}};
  (void)step1(eng, cgsim::GridAction::Beep);

  const auto snap = eng.snapshot();
  EXPECT_EQ(snap.width, 2);
  EXPECT_EQ(snap.height, 2);
  ASSERT_EQ(snap.colors.size(), 4u);
  EXPECT_EQ(snap.colors[2], cgsim::Color::Red);
  EXPECT_EQ(snap.colors[3], cgsim::Color::Wall);
  EXPECT_EQ(snap.visited[2], 1);
  EXPECT_EQ(snap.visited[0], 0);
  ASSERT_EQ(snap.agents.size(), 1u);
  EXPECT_EQ(snap.agents[0], eng.agents()[0].state());
  EXPECT_EQ(snap.step, 1u);
}

TEST(SimulationEngine, SharedRewardsSumAcrossAgents) {
  auto rewards = test_rewards();
  rewards.mode = cgsim::RewardMode::Shared;
  cgsim::SimulationEngine eng{{blank_grid(3, 3), {agent(cgsim::MotionKind::Grid, 0, 0),
                                                  agent(cgsim::MotionKind::Grid, 2, 2)}, rewards}};

  const std::vector<cgsim::Action> actions{cgsim::GridAction::Left, cgsim::GridAction::Nop};
  const auto res = eng.step(actions);
  EXPECT_NEAR(res.rewards[0], -1.02, 1e-12);
  EXPECT_DOUBLE_EQ(res.rewards[1], res.rewards[0]);
}
