#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "cgsim/types.hpp"

namespace cgsim {

struct CliOptions {
  std::string map_path;
  std::vector<MotionKind> agents{MotionKind::Grid};
  uint64_t steps{100};
  uint64_t seed{1};
  bool shared{false};
  bool render{false};
  spdlog::level::level_enum log_level{spdlog::level::info};
};

// Returns false when usage should be printed (help, unknown flag, missing
// value). Throws std::invalid_argument for a malformed value.
bool parse_args(int argc, const char* const* argv, CliOptions& opt);

MotionKind parse_kind(const std::string& s);
std::vector<MotionKind> parse_kinds(const std::string& csv);

// Non-negative decimal integer; rejects signs, trailing junk and overflow.
uint64_t parse_count(std::string_view flag, const std::string& text);

// trace, debug, info, warn, error, critical or off.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace cgsim
