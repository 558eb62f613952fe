#pragma once
#include <limits>
#include <radiant/math/vec.hpp>

using namespace radiant::math;

namespace radiant::core {

/// Minimal ray parameter, keeps secondary rays off their own surface
inline constexpr double RAY_EPS = 1e-4;

struct Ray {
  Vec3 o{0, 0, 0};                                 ///< Origin
  Vec3 d{0, 0, 0};                                 ///< Direction
  double tmin{RAY_EPS};                            ///< Minimal distance
  double tmax{std::numeric_limits<double>::max()}; ///< Maximal distance

  Ray() = default;
  Ray(const Vec3 &origin, const Vec3 &direction) : o(origin), d(direction) {}

  Ray with_distance_max(double t) const {
    Ray r = *this;
    r.tmax = t;
    return r;
  }

  Vec3 point_at(double t) const { return o + d * t; }
};

} // namespace radiant::core
