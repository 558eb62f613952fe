#include <algorithm>
#include <cmath>
#include <limits>
#include <radiant/math/aabb.hpp>

namespace radiant::math {

AABB::AABB(const Vec3 &a, const Vec3 &b)
    : min(std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)),
      max(std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)) {}

bool AABB::is_valid() const {
  return is_finite(min) && is_finite(max) && min.x <= max.x && min.y <= max.y && min.z <= max.z;
}

std::optional<std::pair<double, double>> AABB::clip(const Vec3 &o, const Vec3 &d, double tmin, double tmax) const {
  double t_min = tmin;
  double t_max = tmax;

  for (int axis = 0; axis < 3; ++axis) {
    const double origin = o[axis];
    const double direction = d[axis];

    if (std::abs(direction) < std::numeric_limits<double>::epsilon()) {
      if (origin < min[axis] || origin > max[axis])
        return std::nullopt;
      continue;
    }

    const double inv_dir = 1.0 / direction;
    double t0 = (min[axis] - origin) * inv_dir;
    double t1 = (max[axis] - origin) * inv_dir;
    if (t0 > t1)
      std::swap(t0, t1);

    t_min = std::max(t_min, t0);
    t_max = std::min(t_max, t1);

    if (t_max < t_min)
      return std::nullopt;
  }

  return std::make_pair(t_min, t_max);
}

} // namespace radiant::math
