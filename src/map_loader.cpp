#include "cgsim/map_loader.hpp"
#include "cgsim/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace cgsim {

namespace {
constexpr std::string_view kDefaultMap =
    "r  g  b\n"
    "       \n"
    "y  #  p\n"
    "       \n"
    "o  B  P\n";
} // namespace

std::optional<Color> color_from_char(char ch) noexcept {
  switch (ch) {
    case ' ': return Color::Blank;
    case '#': return Color::Wall;
    case 'r': return Color::Red;
    case 'g': return Color::Green;
    case 'b': return Color::Blue;
    case 'y': return Color::Yellow;
    case 'p': return Color::Pink;
    case 'o': return Color::Orange;
    case 'B': return Color::Brown;
    case 'G': return Color::Gray;
    case 'P': return Color::Purple;
    default:  return std::nullopt;
  }
}

char to_char(Color c) noexcept {
  switch (c) {
    case Color::Blank:  return ' ';
    case Color::Wall:   return '#';
    case Color::Red:    return 'r';
    case Color::Green:  return 'g';
    case Color::Blue:   return 'b';
    case Color::Yellow: return 'y';
    case Color::Pink:   return 'p';
    case Color::Orange: return 'o';
    case Color::Brown:  return 'B';
    case Color::Gray:   return 'G';
    case Color::Purple: return 'P';
  }
  return '?';
}

ColorGrid parse_map(std::string_view text) {
  std::vector<std::vector<Color>> rows;

  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, (nl == std::string_view::npos) ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
    line_no++;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) continue;

    std::vector<Color> row;
    row.reserve(line.size());
    for (std::size_t col = 0; col < line.size(); ++col) {
      const auto c = color_from_char(line[col]);
      if (!c) {
        throw MapFormatError("line " + std::to_string(line_no) + ", column " + std::to_string(col + 1) +
                             ": unsupported character '" + std::string(1, line[col]) + "'");
      }
      row.push_back(*c);
    }

    if (!rows.empty() && row.size() != rows.front().size()) {
      throw MapFormatError("line " + std::to_string(line_no) + " has " + std::to_string(row.size()) +
                           " cells, expected " + std::to_string(rows.front().size()));
    }
    rows.push_back(std::move(row));
  }

  if (rows.empty()) throw MapFormatError("map has no rows");

  // text lists north first; the grid stores y = 0 at the bottom
  std::reverse(rows.begin(), rows.end());
  return ColorGrid(std::move(rows));
}

ColorGrid load_map(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw MapFormatError("cannot open map file " + path.string());

  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_map(ss.str());
}

std::string to_map_string(const ColorGrid& grid) {
  std::string out;
  out.reserve(static_cast<std::size_t>(grid.width() + 1) * static_cast<std::size_t>(grid.height()));
  for (Coord y = grid.height() - 1; y >= 0; --y) {
    for (Coord x = 0; x < grid.width(); ++x) out.push_back(to_char(grid.color_at(x, y)));
    out.push_back('\n');
  }
  return out;
}

std::string_view default_map() noexcept { return kDefaultMap; }

} // namespace cgsim
