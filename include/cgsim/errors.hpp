#pragma once
#include <stdexcept>
#include <string>

namespace cgsim {

// Invalid initial state or malformed numeric bounds; raised at construction only.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Cell lookup outside the grid. Never escapes SimulationEngine.
class OutOfBounds : public std::out_of_range {
public:
  OutOfBounds(double x, double y)
    : std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the grid"),
      x_(x), y_(y) {}

  double x() const noexcept { return x_; }
  double y() const noexcept { return y_; }

private:
  double x_{};
  double y_{};
};

// Action not in the agent's action set (wrong motion model or unknown raw code).
class InvalidAction : public std::logic_error {
public:
  explicit InvalidAction(const std::string& what) : std::logic_error(what) {}
};

class MapFormatError : public std::runtime_error {
public:
  explicit MapFormatError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace cgsim
