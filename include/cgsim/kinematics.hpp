#pragma once
#include <cmath>
#include <type_traits>
#include <variant>

#include "cgsim/types.hpp"

namespace cgsim {

struct Position {
  Real x{};
  Real y{};

  friend bool operator==(const Position&, const Position&) = default;
};

struct Cell {
  Coord x{};
  Coord y{};

  friend bool operator==(const Cell&, const Cell&) = default;
};

struct GridState {
  Coord x{};
  Coord y{};

  friend bool operator==(const GridState&, const GridState&) = default;
};

// theta counts quarter turns counter-clockwise from east: 0=E, 1=N, 2=W, 3=S.
struct RotaryState {
  Coord   x{};
  Coord   y{};
  uint8_t theta{0};

  friend bool operator==(const RotaryState&, const RotaryState&) = default;
};

// angle in degrees, counter-clockwise from +x, kept in [0, 360)
struct ContinuousState {
  Real x{};
  Real y{};
  Real velocity{};
  Real angle{};

  friend bool operator==(const ContinuousState&, const ContinuousState&) = default;
};

// Alternative order matches MotionKind.
using KinematicState = std::variant<GridState, RotaryState, ContinuousState>;

inline MotionKind kind_of(const KinematicState& s) noexcept {
  return static_cast<MotionKind>(s.index()); // relies on variant order above
}

inline Position position_of(const KinematicState& s) noexcept {
  return std::visit([](const auto& k) {
    return Position{static_cast<Real>(k.x), static_cast<Real>(k.y)};
  }, s);
}

inline Cell cell_of(const KinematicState& s) noexcept {
  if (const auto* c = std::get_if<ContinuousState>(&s)) {
    return Cell{static_cast<Coord>(std::floor(c->x)), static_cast<Coord>(std::floor(c->y))};
  }
  const Position p = position_of(s);
  return Cell{static_cast<Coord>(p.x), static_cast<Coord>(p.y)};
}

// Overwrites only the positional part; theta / angle / velocity are untouched.
inline void set_position(KinematicState& s, Position p) noexcept {
  std::visit([&](auto& k) {
    using T = std::decay_t<decltype(k)>;
    if constexpr (std::is_same_v<T, ContinuousState>) {
      k.x = p.x;
      k.y = p.y;
    } else {
      k.x = static_cast<Coord>(p.x);
      k.y = static_cast<Coord>(p.y);
    }
  }, s);
}

inline Real distance(Position a, Position b) noexcept {
  return std::hypot(a.x - b.x, a.y - b.y);
}

} // namespace cgsim
