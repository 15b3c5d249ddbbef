#include <cstdint>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "cgsim/cli_options.hpp"
#include "cgsim/config.hpp"
#include "cgsim/map_loader.hpp"
#include "cgsim/rollout.hpp"
#include "cgsim/simulation_engine.hpp"

namespace {

void usage() {
  std::cout
    << "Usage:\n"
    << "  cgsim_cli [--map FILE] [--agents grid|rotary|continuous,...] [--steps N]\n"
    << "            [--seed S] [--shared] [--render] [--log-level LEVEL]\n";
}

// Agents start on the first free cells scanning from (0, 0).
std::vector<cgsim::AgentConfig> place_agents(const cgsim::ColorGrid& grid,
                                             const std::vector<cgsim::MotionKind>& kinds) {
  std::vector<cgsim::AgentConfig> out;
  for (cgsim::Coord y = 0; y < grid.height() && out.size() < kinds.size(); ++y) {
    for (cgsim::Coord x = 0; x < grid.width() && out.size() < kinds.size(); ++x) {
      if (grid.is_wall(x, y)) continue;
      cgsim::AgentConfig a{};
      a.motion = kinds[out.size()];
      // continuous agents start at the cell centre
      const double offset = (a.motion == cgsim::MotionKind::Continuous) ? 0.5 : 0.0;
      a.initial_position = cgsim::Position{x + offset, y + offset};
      out.push_back(a);
    }
  }
  if (out.size() < kinds.size()) throw std::invalid_argument("map has no room for all agents");
  return out;
}

std::string render_ascii(const cgsim::Snapshot& s) {
  std::vector<std::string> rows(static_cast<std::size_t>(s.height), std::string(static_cast<std::size_t>(s.width), ' '));
  for (cgsim::Coord y = 0; y < s.height; ++y) {
    for (cgsim::Coord x = 0; x < s.width; ++x) {
      const auto i = static_cast<std::size_t>(y) * static_cast<std::size_t>(s.width) + static_cast<std::size_t>(x);
      char ch = cgsim::to_char(s.colors[i]);
      if (s.visited[i]) ch = '+';
      rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)] = ch;
    }
  }
  for (std::size_t k = 0; k < s.agents.size(); ++k) {
    const auto c = cgsim::cell_of(s.agents[k]);
    rows[static_cast<std::size_t>(c.y)][static_cast<std::size_t>(c.x)] = (k < 10) ? static_cast<char>('0' + k) : '@';
  }

  std::ostringstream out;
  out << "step " << s.step << "\n";
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) out << "|" << *it << "|\n";
  return out.str();
}

} // namespace

int main(int argc, char** argv) {
  cgsim::CliOptions opt;
  try {
    if (!cgsim::parse_args(argc, argv, opt)) { usage(); return 1; }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    usage();
    return 1;
  }

  spdlog::set_level(opt.log_level);

  try {
    cgsim::ColorGrid grid = opt.map_path.empty() ? cgsim::parse_map(cgsim::default_map())
                                                 : cgsim::load_map(opt.map_path);

    cgsim::RewardConfig rewards{};
    if (opt.shared) rewards.mode = cgsim::RewardMode::Shared;

    auto agents = place_agents(grid, opt.agents);
    cgsim::SimulationEngine engine{cgsim::EnvironmentConfig{std::move(grid), std::move(agents), rewards}};

    cgsim::RandomRollout rollout(opt.seed);
    const auto stats = rollout.run(engine, opt.steps,
        [&](const cgsim::SimulationEngine& eng, const cgsim::StepResult&) {
          if (opt.render) std::cout << render_ascii(eng.snapshot());
        });

    std::cout << "ROLLOUT COMPLETE"
              << " steps=" << stats.steps
              << " beeps=" << stats.beeps
              << " first_visits=" << stats.first_visits
              << " duplicate_beeps=" << stats.duplicate_beeps
              << " boundary_hits=" << stats.boundary_hits
              << " blocked=" << stats.blocked
              << " visited=" << engine.grid().visited_count() << "/" << engine.grid().painted_count()
              << "\n";
    for (std::size_t i = 0; i < stats.returns.size(); ++i) {
      std::cout << "agent " << i << " (" << cgsim::to_string(engine.agents()[i].kind())
                << ") return=" << stats.returns[i] << "\n";
    }
  } catch (const std::exception& e) {
    spdlog::error("cgsim_cli: {}", e.what());
    return 1;
  }
  return 0;
}
