#include <radiant/math/vec.hpp>

namespace radiant::math {

double dot(const Vec3 &a, const Vec3 &b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

double norm2(const Vec3 &v) {
  return dot(v, v);
}

double norm(const Vec3 &v) {
  return std::sqrt(dot(v, v));
}

Vec3 normalize(const Vec3 &v) {
  const double n = norm(v);
  return (n > 0) ? (v * (1.0 / n)) : Vec3{0, 0, 0};
}

bool is_finite(const Vec3 &v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool is_valid_color(const Vec3 &c) {
  return is_finite(c) && c.x >= 0.0 && c.y >= 0.0 && c.z >= 0.0;
}

Frame::Frame(const Vec3 &n) : z(n) {
  const double sign = std::copysign(1.0, n.z);
  const double a = -1.0 / (sign + n.z);
  const double b = n.x * n.y * a;
  x = {1.0 + sign * n.x * n.x * a, sign * b, -sign * n.x};
  y = {b, sign + n.y * n.y * a, -n.y};
}

Vec3 Frame::to_world(const Vec3 &v) const {
  return x * v.x + y * v.y + z * v.z;
}

Vec3 Frame::to_local(const Vec3 &v) const {
  return {dot(v, x), dot(v, y), dot(v, z)};
}

} // namespace radiant::math
