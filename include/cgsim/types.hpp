#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cgsim {

using AgentIndex = uint32_t;
using Coord      = int32_t;   // discrete cell coordinate
using Real       = double;    // continuous plane coordinate / velocity / degrees
using StepIndex  = uint64_t;

// Integer encoding is the enum position: Blank=0, Wall=1, painted colours after.
enum class Color : uint8_t {
  Blank = 0,
  Wall,
  Red,
  Green,
  Blue,
  Yellow,
  Pink,
  Brown,
  Gray,
  Purple,
  Orange
};

inline constexpr std::size_t kColorCount = 11;

inline constexpr bool is_painted(Color c) noexcept {
  return c != Color::Blank && c != Color::Wall;
}

inline constexpr uint8_t encode(Color c) noexcept { return static_cast<uint8_t>(c); }

enum class MotionKind : uint8_t { Grid = 0, Rotary = 1, Continuous = 2 };

// Raw action codes 0..5 follow the declaration order below.
enum class GridAction : uint8_t { Left = 0, Up, Right, Down, Beep, Nop };
enum class RotaryAction : uint8_t { TurnLeft = 0, Forward, TurnRight, Backward, Beep, Nop };
enum class ContinuousAction : uint8_t { TurnLeft = 0, Accelerate, TurnRight, Decelerate, Beep, Nop };

inline constexpr int kActionCount = 6;

enum class RewardMode : uint8_t { PerAgent = 0, Shared = 1 };

inline std::string_view to_string(Color c) noexcept {
  switch (c) {
    case Color::Blank:  return "blank";
    case Color::Wall:   return "wall";
    case Color::Red:    return "red";
    case Color::Green:  return "green";
    case Color::Blue:   return "blue";
    case Color::Yellow: return "yellow";
    case Color::Pink:   return "pink";
    case Color::Brown:  return "brown";
    case Color::Gray:   return "gray";
    case Color::Purple: return "purple";
    case Color::Orange: return "orange";
  }
  return "?";
}

inline std::string_view to_string(MotionKind k) noexcept {
  switch (k) {
    case MotionKind::Grid:       return "grid";
    case MotionKind::Rotary:     return "rotary";
    case MotionKind::Continuous: return "continuous";
  }
  return "?";
}

inline std::string_view to_string(GridAction a) noexcept {
  switch (a) {
    case GridAction::Left:  return "<";
    case GridAction::Up:    return "^";
    case GridAction::Right: return ">";
    case GridAction::Down:  return "v";
    case GridAction::Beep:  return "o";
    case GridAction::Nop:   return "_";
  }
  return "?";
}

inline std::string_view to_string(RotaryAction a) noexcept {
  switch (a) {
    case RotaryAction::TurnLeft:  return "<";
    case RotaryAction::Forward:   return "^";
    case RotaryAction::TurnRight: return ">";
    case RotaryAction::Backward:  return "v";
    case RotaryAction::Beep:      return "o";
    case RotaryAction::Nop:       return "_";
  }
  return "?";
}

inline std::string_view to_string(ContinuousAction a) noexcept {
  switch (a) {
    case ContinuousAction::TurnLeft:   return "<";
    case ContinuousAction::Accelerate: return "^";
    case ContinuousAction::TurnRight:  return ">";
    case ContinuousAction::Decelerate: return "v";
    case ContinuousAction::Beep:       return "o";
    case ContinuousAction::Nop:        return "_";
  }
  return "?";
}

} // namespace cgsim
