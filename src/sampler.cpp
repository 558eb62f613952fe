#include <radiant/log/logger.hpp>
#include <radiant/sample/sampler.hpp>
#include <stdexcept>

namespace radiant::sample {

IndependentSampler::IndependentSampler(std::uint64_t seed, std::size_t spp)
    : seed_(seed), spp_(spp), rng_(seed) {
  if (spp == 0) {
    RLOG_ERROR("IndependentSampler: sample count must be greater than 0");
    throw std::invalid_argument("IndependentSampler: sample count must be greater than 0");
  }
}

double IndependentSampler::next() {
  return rng_.uniform();
}

Vec2 IndependentSampler::next2d() {
  const double u = rng_.uniform();
  const double v = rng_.uniform();
  return {u, v};
}

std::unique_ptr<Sampler> IndependentSampler::clone_independent_stream(std::uint64_t stream_index) const {
  return std::make_unique<IndependentSampler>(mix_seed(seed_, stream_index), spp_);
}

void IndependentSampler::set_sample_count(std::size_t spp) {
  if (spp == 0) {
    RLOG_ERROR("IndependentSampler::set_sample_count: sample count must be greater than 0");
    throw std::invalid_argument("IndependentSampler: sample count must be greater than 0");
  }
  spp_ = spp;
}

} // namespace radiant::sample
