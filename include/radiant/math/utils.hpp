#pragma once
#include <cmath>
#include <radiant/math/vec.hpp>

namespace radiant::math
{
  inline constexpr double PI = 3.14159265358979323846;
  inline constexpr double INV_PI = 1.0 / PI;
  inline constexpr double INV_TWO_PI = 1.0 / (2.0 * PI);

  // Unit vector of v, or of fallback when v is (numerically) zero
  Vec3 safe_unit(Vec3 v, Vec3 fallback, double eps = 1e-20);

  // Rec. 709 relative luminance
  double luminance(const Color3 &c);
}
