#include <radiant/math/rng.hpp>

namespace radiant::math {

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t index) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (index + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

double Rng::uniform() {
  // uniform_real_distribution may round up to 1.0 for doubles
  const double u = uni(gen);
  return u < 1.0 ? u : 0x1.fffffffffffffp-1;
}

} // namespace radiant::math
