#include "cgsim/color_grid.hpp"
#include "cgsim/errors.hpp"

#include <algorithm>
#include <string>

namespace cgsim {

ColorGrid::ColorGrid(std::vector<std::vector<Color>> rows) {
  if (rows.empty() || rows.front().empty()) {
    throw ConfigurationError("color grid must have at least one row and one column");
  }

  height_ = static_cast<Coord>(rows.size());
  width_ = static_cast<Coord>(rows.front().size());

  colors_.reserve(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_));
  for (std::size_t y = 0; y < rows.size(); ++y) {
    if (static_cast<Coord>(rows[y].size()) != width_) {
      throw ConfigurationError("color grid row " + std::to_string(y) + " has " +
                               std::to_string(rows[y].size()) + " cells, expected " +
                               std::to_string(width_));
    }
    colors_.insert(colors_.end(), rows[y].begin(), rows[y].end());
  }

  painted_total_ = static_cast<uint32_t>(
      std::count_if(colors_.begin(), colors_.end(), [](Color c) { return is_painted(c); }));

  visited_.assign(colors_.size(), 0);
  beeps_.assign(colors_.size(), 0);
}

std::size_t ColorGrid::offset(Coord x, Coord y) const {
  if (!is_inside(x, y)) throw OutOfBounds(x, y);
  return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
}

Color ColorGrid::color_at(Coord x, Coord y) const {
  return colors_[offset(x, y)];
}

bool ColorGrid::is_wall(Coord x, Coord y) const {
  return color_at(x, y) == Color::Wall;
}

bool ColorGrid::mark_visited(Coord x, Coord y) {
  const std::size_t i = offset(x, y);
  const Color c = colors_[i];
  if (c == Color::Wall) return false;

  beeps_[i]++;
  if (!is_painted(c)) return false;
  if (visited_[i]) return false;

  visited_[i] = 1;
  color_visits_[encode(c)]++;
  visited_total_++;
  return true;
}

bool ColorGrid::is_visited(Coord x, Coord y) const {
  return visited_[offset(x, y)] != 0;
}

uint32_t ColorGrid::beep_count(Coord x, Coord y) const {
  return beeps_[offset(x, y)];
}

void ColorGrid::reset() noexcept {
  std::fill(visited_.begin(), visited_.end(), uint8_t{0});
  std::fill(beeps_.begin(), beeps_.end(), 0u);
  color_visits_.fill(0);
  visited_total_ = 0;
}

} // namespace cgsim
