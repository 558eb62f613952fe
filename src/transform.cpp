#include <cmath>
#include <radiant/log/logger.hpp>
#include <radiant/math/transform.hpp>
#include <radiant/math/utils.hpp>
#include <stdexcept>

namespace radiant::math {

Vec3 Mat3::operator*(const Vec3 &v) const {
  const Mat3 &a = *this;
  return {a(0, 0) * v.x + a(0, 1) * v.y + a(0, 2) * v.z,
          a(1, 0) * v.x + a(1, 1) * v.y + a(1, 2) * v.z,
          a(2, 0) * v.x + a(2, 1) * v.y + a(2, 2) * v.z};
}

Mat3 Mat3::operator*(const Mat3 &o) const {
  Mat3 r;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      r(i, j) = (*this)(i, 0) * o(0, j) + (*this)(i, 1) * o(1, j) + (*this)(i, 2) * o(2, j);
    }
  }
  return r;
}

Mat3 Mat3::transposed() const {
  Mat3 r;
  for (int i = 0; i < 3; ++i)
    for (int j = 0; j < 3; ++j)
      r(i, j) = (*this)(j, i);
  return r;
}

double Mat3::determinant() const {
  const Mat3 &a = *this;
  return a(0, 0) * (a(1, 1) * a(2, 2) - a(1, 2) * a(2, 1)) -
         a(0, 1) * (a(1, 0) * a(2, 2) - a(1, 2) * a(2, 0)) +
         a(0, 2) * (a(1, 0) * a(2, 1) - a(1, 1) * a(2, 0));
}

Mat3 Mat3::inverse() const {
  const Mat3 &a = *this;
  const double det = determinant();
  if (std::abs(det) < 1e-300) {
    RLOG_ERROR("Mat3::inverse: singular matrix (det = {})", det);
    throw std::invalid_argument("Mat3::inverse: singular matrix");
  }
  const double inv = 1.0 / det;

  Mat3 r;
  r(0, 0) = (a(1, 1) * a(2, 2) - a(1, 2) * a(2, 1)) * inv;
  r(0, 1) = (a(0, 2) * a(2, 1) - a(0, 1) * a(2, 2)) * inv;
  r(0, 2) = (a(0, 1) * a(1, 2) - a(0, 2) * a(1, 1)) * inv;
  r(1, 0) = (a(1, 2) * a(2, 0) - a(1, 0) * a(2, 2)) * inv;
  r(1, 1) = (a(0, 0) * a(2, 2) - a(0, 2) * a(2, 0)) * inv;
  r(1, 2) = (a(0, 2) * a(1, 0) - a(0, 0) * a(1, 2)) * inv;
  r(2, 0) = (a(1, 0) * a(2, 1) - a(1, 1) * a(2, 0)) * inv;
  r(2, 1) = (a(0, 1) * a(2, 0) - a(0, 0) * a(2, 1)) * inv;
  r(2, 2) = (a(0, 0) * a(1, 1) - a(0, 1) * a(1, 0)) * inv;
  return r;
}

Transform::Transform(const Mat3 &linear, const Vec3 &translation)
    : linear_(linear), translation_(translation) {
  inv_linear_ = linear_.inverse();
  inv_translation_ = -(inv_linear_ * translation_);
}

Transform Transform::translate(const Vec3 &t) {
  return Transform(Mat3{}, t);
}

Transform Transform::scale(const Vec3 &s) {
  Mat3 m;
  m(0, 0) = s.x;
  m(1, 1) = s.y;
  m(2, 2) = s.z;
  return Transform(m, Vec3{});
}

Transform Transform::rotate(const Vec3 &axis, double degrees) {
  const Vec3 a = normalize(axis);
  const double theta = degrees * PI / 180.0;
  const double c = std::cos(theta);
  const double s = std::sin(theta);
  const double t = 1.0 - c;

  Mat3 m;
  m(0, 0) = t * a.x * a.x + c;
  m(0, 1) = t * a.x * a.y - s * a.z;
  m(0, 2) = t * a.x * a.z + s * a.y;
  m(1, 0) = t * a.x * a.y + s * a.z;
  m(1, 1) = t * a.y * a.y + c;
  m(1, 2) = t * a.y * a.z - s * a.x;
  m(2, 0) = t * a.x * a.z - s * a.y;
  m(2, 1) = t * a.y * a.z + s * a.x;
  m(2, 2) = t * a.z * a.z + c;
  return Transform(m, Vec3{});
}

Transform Transform::look_at(const Vec3 &origin, const Vec3 &target, const Vec3 &up) {
  const Vec3 dir = normalize(target - origin);
  const Vec3 left = normalize(cross(up, dir));
  if (norm2(left) == 0.0) {
    RLOG_ERROR("Transform::look_at: up vector is parallel to the view direction");
    throw std::invalid_argument("Transform::look_at: degenerate up vector");
  }
  const Vec3 new_up = cross(dir, left);

  // Columns are the camera axes: x = right, y = up, z = backward
  Mat3 m;
  const Vec3 right = -left;
  const Vec3 back = -dir;
  for (int i = 0; i < 3; ++i) {
    m(i, 0) = right[i];
    m(i, 1) = new_up[i];
    m(i, 2) = back[i];
  }
  return Transform(m, origin);
}

Transform Transform::operator*(const Transform &o) const {
  return Transform(linear_ * o.linear_, linear_ * o.translation_ + translation_);
}

Vec3 Transform::point(const Vec3 &p) const {
  return linear_ * p + translation_;
}

Vec3 Transform::vector(const Vec3 &v) const {
  return linear_ * v;
}

Vec3 Transform::normal(const Vec3 &n) const {
  return inv_linear_.transposed() * n;
}

Transform Transform::inverse() const {
  return Transform(inv_linear_, inv_translation_);
}

} // namespace radiant::math
