#pragma once
#include <cstdint>
#include <random>

namespace cgsim {

// Seeded 64-bit Mersenne Twister; identical seeds give identical streams.
class Rng {
public:
  explicit Rng(uint64_t seed) : gen_(seed) {}

  // inclusive on both ends
  int32_t uniform_int(int32_t lo, int32_t hi) {
    return std::uniform_int_distribution<int32_t>(lo, hi)(gen_);
  }

private:
  std::mt19937_64 gen_;
};

} // namespace cgsim
