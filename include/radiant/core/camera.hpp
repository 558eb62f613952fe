#pragma once
#include <cstddef>
#include <radiant/core/ray.hpp>
#include <radiant/math/transform.hpp>
#include <radiant/math/vec.hpp>

using namespace radiant::math;

namespace radiant::core {

/// @brief Pinhole camera looking down its local -z axis
class PerspectiveCamera {
public:
  /// @param to_world Camera-to-world transform (see Transform::look_at)
  /// @param width,height Image resolution in pixels
  /// @param vfov Vertical field of view in degrees, in (0, 180)
  /// @param fdist Distance to the focal plane
  PerspectiveCamera(const Transform &to_world, std::size_t width, std::size_t height, double vfov = 60.0,
                    double fdist = 1.0);

  /// @brief Primary ray through an image-plane position in pixel units,
  /// (0, 0) top-left and (width, height) bottom-right
  Ray generate_ray(const Vec2 &pos_img) const;

  std::size_t width() const { return width_; }
  std::size_t height() const { return height_; }

private:
  std::size_t width_;
  std::size_t height_;
  Vec3 origin_;
  Vec3 up_left_corner_;
  Vec3 horizontal_; ///< World offset of one pixel step along x
  Vec3 vertical_;   ///< World offset of one pixel step along y
};

} // namespace radiant::core
