#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "cgsim/kinematics.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

// Fixed colour geometry plus the per-episode visited bitmap.
// Row-major storage; (0, 0) is the bottom-left cell and y grows northwards.
class ColorGrid {
public:
  // `rows` is indexed [y][x]. Throws ConfigurationError when empty or ragged.
  explicit ColorGrid(std::vector<std::vector<Color>> rows);

  Coord width() const noexcept { return width_; }
  Coord height() const noexcept { return height_; }

  bool is_inside(Coord x, Coord y) const noexcept {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
  }
  bool is_inside(Real x, Real y) const noexcept {
    return x >= 0.0 && y >= 0.0 && x < static_cast<Real>(width_) && y < static_cast<Real>(height_);
  }
  bool is_inside(Cell c) const noexcept { return is_inside(c.x, c.y); }

  // Throws OutOfBounds.
  Color color_at(Coord x, Coord y) const;
  Color color_at(Cell c) const { return color_at(c.x, c.y); }

  bool is_wall(Coord x, Coord y) const;

  // True only on the first visit of a painted cell. Blank and wall cells
  // are never marked. Throws OutOfBounds.
  bool mark_visited(Coord x, Coord y);

  bool is_visited(Coord x, Coord y) const;
  uint32_t beep_count(Coord x, Coord y) const;

  // Number of distinct cells of colour `c` visited this episode.
  uint32_t color_visits(Color c) const noexcept { return color_visits_[encode(c)]; }
  uint32_t visited_count() const noexcept { return visited_total_; }
  uint32_t painted_count() const noexcept { return painted_total_; }

  // Clears visited bitmap and counters; geometry is untouched.
  void reset() noexcept;

private:
  Coord width_{0};
  Coord height_{0};

  std::vector<Color>    colors_;
  std::vector<uint8_t>  visited_;
  std::vector<uint32_t> beeps_;

  std::array<uint32_t, kColorCount> color_visits_{};
  uint32_t visited_total_{0};
  uint32_t painted_total_{0};

  std::size_t offset(Coord x, Coord y) const;
};

} // namespace cgsim
