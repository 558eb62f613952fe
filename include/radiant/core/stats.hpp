#pragma once
#include <cstddef>

namespace radiant::core {

/// @brief Per-task ray tracing counters, merged after the parallel join
struct RenderStats {
  std::size_t intersections{0};       ///< Analytic primitive intersection tests
  std::size_t traced_rays{0};         ///< Scene queries (camera, continuation, shadow)
  std::size_t raymarch_steps{0};      ///< Sphere-tracing iterations
  std::size_t raymarch_hits{0};       ///< Marches ending in RaymarchStatus::Hit
  std::size_t raymarch_misses{0};     ///< Marches ending in RaymarchStatus::Miss
  std::size_t raymarch_escaped{0};    ///< Marches ending in RaymarchStatus::EscapedBounds
  std::size_t raymarch_exhausted{0};  ///< Marches ending in RaymarchStatus::MaxStepsExceeded
  std::size_t rejected_samples{0};    ///< Non-finite pixel samples dropped

  /// @brief Accumulate counters from another task
  void merge_from(const RenderStats &other);

  /// @brief #intersections / #traced rays, 0 when no ray was traced
  double intersections_per_ray() const;
};

} // namespace radiant::core
