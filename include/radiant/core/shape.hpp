#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <radiant/core/material.hpp>
#include <radiant/core/ray.hpp>
#include <radiant/core/stats.hpp>
#include <radiant/math/transform.hpp>
#include <radiant/math/vec.hpp>
#include <utility>
#include <vector>

using namespace radiant::math;

namespace radiant::core {

class Shape;

/// @brief Analytic ray/surface intersection record
struct Intersection {
  double t{0.0};                    ///< Ray parameter
  Vec3 p;                           ///< World-space position
  Vec3 n;                           ///< Unit shading normal
  const Material *material{nullptr}; ///< Owned by the scene
  const Shape *shape{nullptr};       ///< Primitive that was hit
};

/// @brief Point sampled on an emitter, seen from a shading point
struct EmitterSample {
  Vec3 y;          ///< Point on the emitter
  Vec3 n;          ///< Emitter normal at y
  double pdf{0.0}; ///< Solid-angle density at the shading point
};

class Shape {
public:
  virtual ~Shape() = default;

  /// @brief Closest intersection within [ray.tmin, ray.tmax]
  virtual std::optional<Intersection> hit(const Ray &ray, RenderStats &stats) const = 0;

  /// @brief Sample a point on an emitter as seen from p
  /// @return The sample and the primitive it lies on
  virtual std::pair<EmitterSample, const Shape *> sample_direct(const Vec3 &p, const Vec2 &sample) const = 0;

  /// @brief Solid-angle density of sample_direct producing y (normal n) on `shape` from p
  virtual double pdf_direct(const Shape &shape, const Vec3 &p, const Vec3 &y, const Vec3 &n) const = 0;

  virtual const Material &material() const = 0;
};

/// @brief Rectangle spanning [-size.x/2, size.x/2] x [-size.y/2, size.y/2] in
/// the local z = 0 plane, facing local +z
class Quad : public Shape {
public:
  Quad(const Transform &to_world, const Vec2 &size, std::shared_ptr<const Material> material);

  std::optional<Intersection> hit(const Ray &ray, RenderStats &stats) const override;
  std::pair<EmitterSample, const Shape *> sample_direct(const Vec3 &p, const Vec2 &sample) const override;
  double pdf_direct(const Shape &shape, const Vec3 &p, const Vec3 &y, const Vec3 &n) const override;
  const Material &material() const override { return *material_; }

  double area() const { return area_; }

private:
  Transform to_world_;
  Transform to_local_;
  Vec2 half_size_;
  Vec3 normal_;
  double area_;
  std::shared_ptr<const Material> material_;
};

/// @brief Linear list of shapes; emitters are registered as they are added
class ShapeGroup : public Shape {
public:
  ShapeGroup() = default;

  void add_shape(std::unique_ptr<Shape> shape);

  std::optional<Intersection> hit(const Ray &ray, RenderStats &stats) const override;
  std::pair<EmitterSample, const Shape *> sample_direct(const Vec3 &p, const Vec2 &sample) const override;
  double pdf_direct(const Shape &shape, const Vec3 &p, const Vec3 &y, const Vec3 &n) const override;
  const Material &material() const override;

  std::size_t size() const { return shapes_.size(); }
  std::size_t emitter_count() const { return emitters_.size(); }

private:
  std::vector<std::unique_ptr<Shape>> shapes_;
  std::vector<std::size_t> emitters_;
};

} // namespace radiant::core
