#pragma once
#include <cstdint>
#include <random>

namespace radiant::math {

/// @brief Derive an independent stream seed from a base seed and a stream index
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t index);

struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = std::random_device{}()) : gen(seed) {}

  /// @brief Uniform number in [0, 1)
  double uniform();
};

} // namespace radiant::math
