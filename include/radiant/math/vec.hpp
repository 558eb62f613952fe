#pragma once
#include <cmath>

namespace radiant::math {

struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3() = default;
  Vec3(double x, double y, double z) : x(x), y(y), z(z) {}

  double &operator[](int i) { return (&x)[i]; }
  const double &operator[](int i) const { return (&x)[i]; }

  Vec3 operator-() const { return {-x, -y, -z}; }
  Vec3 &operator+=(const Vec3 &o) {
    x += o.x;
    y += o.y;
    z += o.z;
    return *this;
  }
  Vec3 &operator*=(const Vec3 &o) {
    x *= o.x;
    y *= o.y;
    z *= o.z;
    return *this;
  }
  Vec3 &operator*=(double s) {
    x *= s;
    y *= s;
    z *= s;
    return *this;
  }
};

struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x, double y) : x(x), y(y) {}
};

/// Linear RGB radiance, multiplied channel by channel
using Color3 = Vec3;

inline const Vec3 X_UNIT_VEC3{1.0, 0.0, 0.0};
inline const Vec3 Y_UNIT_VEC3{0.0, 1.0, 0.0};
inline const Vec3 Z_UNIT_VEC3{0.0, 0.0, 1.0};

inline Vec3 operator+(const Vec3 &a, const Vec3 &b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}
inline Vec3 operator-(const Vec3 &a, const Vec3 &b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}
inline Vec3 operator*(const Vec3 &a, const Vec3 &b) {
  return {a.x * b.x, a.y * b.y, a.z * b.z};
}
inline Vec3 operator*(const Vec3 &a, double s) {
  return {a.x * s, a.y * s, a.z * s};
}
inline Vec3 operator*(double s, const Vec3 &a) { return a * s; }
inline Vec3 operator/(const Vec3 &a, double s) {
  return {a.x / s, a.y / s, a.z / s};
}

double dot(const Vec3 &a, const Vec3 &b);
Vec3 cross(const Vec3 &a, const Vec3 &b);
double norm2(const Vec3 &v);
double norm(const Vec3 &v);
Vec3 normalize(const Vec3 &v);

/// @brief True when every channel is finite
bool is_finite(const Vec3 &v);

/// @brief True when every channel is finite and non-negative
bool is_valid_color(const Vec3 &c);

/// @brief Orthonormal basis around a unit normal (Duff et al. 2017)
struct Frame {
  Vec3 x;
  Vec3 y;
  Vec3 z;

  explicit Frame(const Vec3 &n);

  Vec3 to_world(const Vec3 &v) const;
  Vec3 to_local(const Vec3 &v) const;
};

} // namespace radiant::math
