#pragma once
#include <array>
#include <radiant/math/vec.hpp>

namespace radiant::math {

/// @brief Row-major 3x3 matrix
struct Mat3 {
  std::array<double, 9> m{1, 0, 0, 0, 1, 0, 0, 0, 1};

  double &operator()(int i, int j) { return m[i * 3 + j]; }
  const double &operator()(int i, int j) const { return m[i * 3 + j]; }

  Vec3 operator*(const Vec3 &v) const;
  Mat3 operator*(const Mat3 &o) const;

  Mat3 transposed() const;
  double determinant() const;
  Mat3 inverse() const;
};

/// @brief Affine transform p' = L p + t, with its inverse cached
class Transform {
public:
  Transform() = default;
  Transform(const Mat3 &linear, const Vec3 &translation);

  static Transform translate(const Vec3 &t);
  static Transform scale(const Vec3 &s);
  /// @brief Rotation of `degrees` around `axis` (right-handed)
  static Transform rotate(const Vec3 &axis, double degrees);
  /// @brief Camera-to-world transform looking from `origin` at `target`; the
  /// camera looks down its local -z axis
  static Transform look_at(const Vec3 &origin, const Vec3 &target, const Vec3 &up);

  /// @brief Composition: (a * b).point(p) == a.point(b.point(p))
  Transform operator*(const Transform &o) const;

  Vec3 point(const Vec3 &p) const;
  Vec3 vector(const Vec3 &v) const;
  /// @brief Transform a normal with the inverse transpose (not renormalized)
  Vec3 normal(const Vec3 &n) const;

  Transform inverse() const;

  const Mat3 &linear() const { return linear_; }
  const Vec3 &translation() const { return translation_; }

private:
  Mat3 linear_{};
  Vec3 translation_{};
  Mat3 inv_linear_{};
  Vec3 inv_translation_{};
};

} // namespace radiant::math
