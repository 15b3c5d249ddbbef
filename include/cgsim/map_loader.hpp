#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cgsim/color_grid.hpp"
#include "cgsim/types.hpp"

namespace cgsim {

// ASCII maps: one character per cell, rows listed top (north) to bottom.
//   ' ' blank   '#' wall
//   r red  g green  b blue  y yellow  p pink  o orange
//   B brown  G gray  P purple
// Blank lines are skipped; a trailing '\r' is dropped.
std::optional<Color> color_from_char(char ch) noexcept;
char to_char(Color c) noexcept;

// Throws MapFormatError.
ColorGrid parse_map(std::string_view text);
ColorGrid load_map(const std::filesystem::path& path);

// Inverse of parse_map (walls, colours, blanks).
std::string to_map_string(const ColorGrid& grid);

// Built-in 7x5 map used when no map file is given.
std::string_view default_map() noexcept;

} // namespace cgsim
