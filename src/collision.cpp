#include "cgsim/collision.hpp"
#include "cgsim/errors.hpp"

#include <stdexcept>

namespace cgsim {

namespace {
inline bool is_discrete(const KinematicState& s) noexcept {
  return !std::holds_alternative<ContinuousState>(s);
}

inline bool is_stationary(const KinematicState& accepted, const KinematicState& current) noexcept {
  return position_of(accepted) == position_of(current);
}

// A discrete agent occupies its whole cell; measure from the cell centre.
inline Position body_centre(const KinematicState& s) noexcept {
  const Position p = position_of(s);
  if (!is_discrete(s)) return p;
  return Position{p.x + 0.5, p.y + 0.5};
}
} // namespace

bool in_conflict(const KinematicState& a, const KinematicState& b, Real min_separation) noexcept {
  const bool a_discrete = is_discrete(a);
  const bool b_discrete = is_discrete(b);
  if (a_discrete && b_discrete) return cell_of(a) == cell_of(b);
  if ((a_discrete || b_discrete) && cell_of(a) == cell_of(b)) return true;
  return distance(body_centre(a), body_centre(b)) < min_separation;
}

void CollisionResolver::revert(KinematicState& accepted, const KinematicState& current) noexcept {
  set_position(accepted, position_of(current));
  if (auto* c = std::get_if<ContinuousState>(&accepted)) c->velocity = 0.0;
}

Resolution CollisionResolver::resolve(const ColorGrid& grid,
                                      std::span<const KinematicState> current,
                                      std::span<const KinematicState> proposed) const {
  if (current.size() != proposed.size()) {
    throw std::invalid_argument("resolve: current and proposed sizes differ");
  }

  Resolution out{};
  out.accepted.assign(proposed.begin(), proposed.end());
  out.events.resize(proposed.size());

  // Map bounds and walls, independently per agent
  for (std::size_t i = 0; i < out.accepted.size(); ++i) {
    auto& acc = out.accepted[i];
    auto& ev = out.events[i];
    try {
      if (grid.color_at(cell_of(acc)) == Color::Wall) {
        revert(acc, current[i]);
        ev.blocked = true;
        out.reverts++;
      }
    } catch (const OutOfBounds&) {
      revert(acc, current[i]);
      ev.hit_boundary = true;
      out.reverts++;
    }
  }

  // Inter-agent conflicts. Each pass reverts at least one mover, and a
  // reverted agent sits on its pre-step position, which was conflict-free.
  bool changed = true;
  while (changed) {
    changed = false;
    for (std::size_t i = 0; i < out.accepted.size(); ++i) {
      for (std::size_t j = i + 1; j < out.accepted.size(); ++j) {
        if (!in_conflict(out.accepted[i], out.accepted[j], min_separation_)) continue;

        const bool i_still = is_stationary(out.accepted[i], current[i]);
        const bool j_still = is_stationary(out.accepted[j], current[j]);
        if (i_still && j_still) continue; // pre-existing overlap; nothing to undo

        const std::size_t loser = (j_still) ? i : j;
        revert(out.accepted[loser], current[loser]);
        out.events[loser].blocked = true;
        out.reverts++;
        changed = true;
      }
    }
  }

  for (std::size_t i = 0; i < out.accepted.size(); ++i) {
    out.events[i].moved = !is_stationary(out.accepted[i], current[i]);
  }
  return out;
}

} // namespace cgsim
