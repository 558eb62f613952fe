#include <radiant/math/utils.hpp>

namespace radiant::math
{
  Vec3 safe_unit(Vec3 v, Vec3 fallback, double eps)
  {
    double n2 = dot(v, v);
    if (n2 <= eps)
    {
      double f2 = dot(fallback, fallback);
      if (f2 <= eps)
        return Vec3(0, 1, 0);
      return fallback * (1.0 / std::sqrt(f2));
    }
    return v * (1.0 / std::sqrt(n2));
  }

  double luminance(const Color3 &c)
  {
    return 0.212671 * c.x + 0.715160 * c.y + 0.072169 * c.z;
  }
}
