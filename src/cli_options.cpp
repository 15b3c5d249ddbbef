#include "cgsim/cli_options.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace cgsim {

MotionKind parse_kind(const std::string& s) {
  if (s == "grid") return MotionKind::Grid;
  if (s == "rotary") return MotionKind::Rotary;
  if (s == "continuous") return MotionKind::Continuous;
  throw std::invalid_argument("unknown motion model '" + s + "'");
}

std::vector<MotionKind> parse_kinds(const std::string& csv) {
  std::vector<MotionKind> out;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(parse_kind(item));
  }
  if (out.empty()) throw std::invalid_argument("--agents needs at least one motion model");
  return out;
}

uint64_t parse_count(std::string_view flag, const std::string& text) {
  const auto bad = [&]() {
    return std::invalid_argument(std::string(flag) + " expects a non-negative integer, got '" + text + "'");
  };

  // stoull would accept "-1" and wrap it
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) throw bad();

  std::size_t used = 0;
  uint64_t value = 0;
  try {
    value = std::stoull(text, &used);
  } catch (const std::out_of_range&) {
    throw bad();
  }
  if (used != text.size()) throw bad();
  return value;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
  // from_str maps anything it does not know to off
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level '" + name + "'");
  }
  return level;
}

bool parse_args(int argc, const char* const* argv, CliOptions& opt) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = (i + 1 < argc);

    if (arg == "--help" || arg == "-h") return false;
    if (arg == "--shared") { opt.shared = true; continue; }
    if (arg == "--render") { opt.render = true; continue; }
    if (!has_value) return false;

    if (arg == "--map") opt.map_path = argv[++i];
    else if (arg == "--agents") opt.agents = parse_kinds(argv[++i]);
    else if (arg == "--steps") opt.steps = parse_count(arg, argv[++i]);
    else if (arg == "--seed") opt.seed = parse_count(arg, argv[++i]);
    else if (arg == "--log-level") opt.log_level = parse_log_level(argv[++i]);
    else return false;
  }
  return true;
}

} // namespace cgsim
