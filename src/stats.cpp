#include <radiant/core/stats.hpp>

namespace radiant::core {

void RenderStats::merge_from(const RenderStats &other) {
  intersections += other.intersections;
  traced_rays += other.traced_rays;
  raymarch_steps += other.raymarch_steps;
  raymarch_hits += other.raymarch_hits;
  raymarch_misses += other.raymarch_misses;
  raymarch_escaped += other.raymarch_escaped;
  raymarch_exhausted += other.raymarch_exhausted;
  rejected_samples += other.rejected_samples;
}

double RenderStats::intersections_per_ray() const {
  if (traced_rays == 0)
    return 0.0;
  return static_cast<double>(intersections) / static_cast<double>(traced_rays);
}

} // namespace radiant::core
