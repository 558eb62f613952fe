#include <cmath>
#include <radiant/core/camera.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/math/utils.hpp>
#include <stdexcept>

namespace radiant::core {

PerspectiveCamera::PerspectiveCamera(const Transform &to_world, std::size_t width, std::size_t height, double vfov,
                                     double fdist)
    : width_(width), height_(height) {
  if (width == 0 || height == 0) {
    RLOG_ERROR("PerspectiveCamera: invalid resolution {}x{}", width, height);
    throw std::invalid_argument("PerspectiveCamera: resolution must be non-zero");
  }
  if (!(vfov > 0.0 && vfov < 180.0)) {
    RLOG_ERROR("PerspectiveCamera: vertical fov must be in (0, 180) degrees, got {}", vfov);
    throw std::invalid_argument("PerspectiveCamera: invalid vertical fov");
  }
  if (!(fdist > 0.0)) {
    RLOG_ERROR("PerspectiveCamera: focal distance must be positive, got {}", fdist);
    throw std::invalid_argument("PerspectiveCamera: invalid focal distance");
  }

  const double aspect = static_cast<double>(width) / static_cast<double>(height);
  const double viewport_height = 2.0 * std::tan(vfov * PI / 360.0) * fdist;
  const double viewport_width = aspect * viewport_height;

  const Vec3 u{viewport_width, 0.0, 0.0};
  const Vec3 v{0.0, -viewport_height, 0.0};
  const Vec3 corner_local = Vec3{0.0, 0.0, -fdist} - u * 0.5 - v * 0.5;

  origin_ = to_world.point({0.0, 0.0, 0.0});
  up_left_corner_ = to_world.point(corner_local);
  horizontal_ = to_world.vector(u / static_cast<double>(width));
  vertical_ = to_world.vector(v / static_cast<double>(height));
}

Ray PerspectiveCamera::generate_ray(const Vec2 &pos_img) const {
  const Vec3 p_focal = up_left_corner_ + horizontal_ * pos_img.x + vertical_ * pos_img.y;
  return Ray(origin_, normalize(p_focal - origin_));
}

} // namespace radiant::core
