#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <radiant/math/rng.hpp>
#include <radiant/math/vec.hpp>

using namespace radiant::math;

namespace radiant::sample {

/// @brief Source of uniform random numbers for path-vertex decisions
class Sampler {
public:
  virtual ~Sampler() = default;

  /// @brief Uniform number in [0, 1)
  virtual double next() = 0;
  /// @brief Uniform point in [0, 1)^2
  virtual Vec2 next2d() = 0;

  /// @brief Sampler whose stream depends only on this sampler's seed and
  /// `stream_index`, never on how much of this stream was consumed
  virtual std::unique_ptr<Sampler> clone_independent_stream(std::uint64_t stream_index) const = 0;

  virtual std::size_t sample_count() const = 0;
  virtual void set_sample_count(std::size_t spp) = 0;
};

class IndependentSampler : public Sampler {
public:
  IndependentSampler(std::uint64_t seed, std::size_t spp);

  double next() override;
  Vec2 next2d() override;
  std::unique_ptr<Sampler> clone_independent_stream(std::uint64_t stream_index) const override;

  std::size_t sample_count() const override { return spp_; }
  void set_sample_count(std::size_t spp) override;

  std::uint64_t seed() const { return seed_; }

private:
  std::uint64_t seed_;
  std::size_t spp_;
  Rng rng_;
};

} // namespace radiant::sample
