#include <algorithm>
#include <cmath>
#include <radiant/math/utils.hpp>
#include <radiant/sample/warp.hpp>

namespace radiant::sample {

Vec3 sample_cosine_hemisphere(const Vec2 &u) {
  const double r = std::sqrt(u.x);
  const double phi = 2.0 * PI * u.y;
  const double x = r * std::cos(phi);
  const double y = r * std::sin(phi);
  const double z = std::sqrt(std::max(0.0, 1.0 - x * x - y * y));
  return {x, y, z};
}

double pdf_cosine_hemisphere(const Vec3 &dir) {
  return dir.z > 0.0 ? dir.z * INV_PI : 0.0;
}

Vec3 sample_uniform_hemisphere(const Vec2 &u) {
  const double z = 1.0 - u.x;
  const double r = std::sqrt(std::max(0.0, 1.0 - z * z));
  const double phi = 2.0 * PI * u.y;
  return {r * std::cos(phi), r * std::sin(phi), z};
}

double pdf_uniform_hemisphere(const Vec3 &dir) {
  return dir.z > 0.0 ? INV_TWO_PI : 0.0;
}

} // namespace radiant::sample
