#include <algorithm>
#include <cmath>
#include <radiant/core/shape.hpp>
#include <radiant/log/logger.hpp>
#include <stdexcept>

namespace radiant::core {

namespace {

// Area density converted to solid angle at p: p_A d^2 / |cos(theta_y)|
double area_to_solid_angle(double pdf_area, const Vec3 &p, const Vec3 &y, const Vec3 &n) {
  const Vec3 d = y - p;
  const double dist2 = norm2(d);
  const double dist = std::sqrt(dist2);
  const Vec3 dir = d / std::max(dist, 1e-12);
  const double cos_theta = std::max(std::abs(dot(n, dir)), 1e-12);
  return pdf_area * dist2 / cos_theta;
}

} // namespace

Quad::Quad(const Transform &to_world, const Vec2 &size, std::shared_ptr<const Material> material)
    : to_world_(to_world), to_local_(to_world.inverse()),
      half_size_(size.x / 2.0, size.y / 2.0), material_(std::move(material)) {
  if (!(size.x > 0.0) || !(size.y > 0.0)) {
    RLOG_ERROR("Quad: size must be positive, got ({}, {})", size.x, size.y);
    throw std::invalid_argument("Quad: size must be positive");
  }
  if (!material_) {
    RLOG_ERROR("Quad: a material is required");
    throw std::invalid_argument("Quad: a material is required");
  }

  normal_ = normalize(to_world_.normal(Z_UNIT_VEC3));
  const Vec3 ax = to_world_.vector({size.x, 0.0, 0.0});
  const Vec3 ay = to_world_.vector({0.0, size.y, 0.0});
  area_ = norm(cross(ax, ay));
}

std::optional<Intersection> Quad::hit(const Ray &ray, RenderStats &stats) const {
  stats.intersections += 1;

  const Vec3 o = to_local_.point(ray.o);
  const Vec3 d = to_local_.vector(ray.d);

  if (d.z == 0.0)
    return std::nullopt;

  const double t = -o.z / d.z;
  if (t < ray.tmin || ray.tmax < t)
    return std::nullopt;

  const Vec3 p = o + d * t;
  if (std::abs(p.x) > half_size_.x || std::abs(p.y) > half_size_.y)
    return std::nullopt;

  Intersection its;
  its.t = t;
  its.p = to_world_.point({p.x, p.y, 0.0});
  its.n = normal_;
  its.material = material_.get();
  its.shape = this;
  return its;
}

std::pair<EmitterSample, const Shape *> Quad::sample_direct(const Vec3 &p, const Vec2 &sample) const {
  const Vec3 local{(sample.x - 0.5) * 2.0 * half_size_.x, (sample.y - 0.5) * 2.0 * half_size_.y, 0.0};

  EmitterSample es;
  es.y = to_world_.point(local);
  es.n = normal_;
  es.pdf = area_to_solid_angle(1.0 / area_, p, es.y, es.n);
  return {es, this};
}

double Quad::pdf_direct(const Shape &, const Vec3 &p, const Vec3 &y, const Vec3 &n) const {
  return area_to_solid_angle(1.0 / area_, p, y, n);
}

void ShapeGroup::add_shape(std::unique_ptr<Shape> shape) {
  if (!shape) {
    RLOG_ERROR("ShapeGroup::add_shape: null shape");
    throw std::invalid_argument("ShapeGroup::add_shape: null shape");
  }
  const std::size_t idx = shapes_.size();
  shapes_.push_back(std::move(shape));
  if (shapes_[idx]->material().have_emission()) {
    emitters_.push_back(idx);
  }
}

std::optional<Intersection> ShapeGroup::hit(const Ray &ray, RenderStats &stats) const {
  Ray r = ray;
  std::optional<Intersection> closest;
  for (const auto &s : shapes_) {
    if (auto its = s->hit(r, stats)) {
      if (its->t < r.tmax) {
        r.tmax = its->t;
        closest = its;
      }
    }
  }
  return closest;
}

std::pair<EmitterSample, const Shape *> ShapeGroup::sample_direct(const Vec3 &p, const Vec2 &sample) const {
  if (emitters_.empty())
    return {EmitterSample{}, nullptr};

  const double n = static_cast<double>(emitters_.size());
  const std::size_t j = std::min(static_cast<std::size_t>(sample.x * n), emitters_.size() - 1);
  // Rescale so the reused coordinate is uniform in [0, 1) again
  const Vec2 rescaled(sample.x * n - static_cast<double>(j), sample.y);

  auto [es, shape] = shapes_[emitters_[j]]->sample_direct(p, rescaled);
  es.pdf /= n;
  return {es, shape};
}

double ShapeGroup::pdf_direct(const Shape &shape, const Vec3 &p, const Vec3 &y, const Vec3 &n) const {
  if (emitters_.empty())
    return 0.0;
  return shape.pdf_direct(shape, p, y, n) / static_cast<double>(emitters_.size());
}

const Material &ShapeGroup::material() const {
  if (shapes_.empty()) {
    RLOG_ERROR("ShapeGroup::material() called on an empty group");
    throw std::logic_error("ShapeGroup::material() called on an empty group");
  }
  return shapes_.front()->material();
}

} // namespace radiant::core
