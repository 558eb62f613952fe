#pragma once
#include <optional>
#include <radiant/math/vec.hpp>
#include <utility>

namespace radiant::math {

/// @brief Axis-aligned bounding box
struct AABB {
  Vec3 min;
  Vec3 max;

  AABB() = default;
  AABB(const Vec3 &a, const Vec3 &b);

  /// @brief Finite, non-inverted extents
  bool is_valid() const;

  /// @brief Slab test of the segment o + t d, t in [tmin, tmax]
  /// @return Entry and exit parameters clipped to [tmin, tmax]
  std::optional<std::pair<double, double>> clip(const Vec3 &o, const Vec3 &d, double tmin, double tmax) const;
};

} // namespace radiant::math
