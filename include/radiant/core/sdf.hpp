#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <radiant/core/material.hpp>
#include <radiant/core/ray.hpp>
#include <radiant/core/stats.hpp>
#include <radiant/math/aabb.hpp>
#include <radiant/math/transform.hpp>
#include <radiant/math/vec.hpp>
#include <string_view>
#include <utility>

using namespace radiant::math;

namespace radiant::core {

/// @brief Optional marching parameters, typically parsed from a scene file
struct RaymarchOverrides {
  std::optional<std::uint32_t> max_steps;
  std::optional<double> hit_epsilon;
  std::optional<double> normal_epsilon;
  std::optional<double> step_clamp;
  std::optional<double> max_travel_distance;
  std::optional<double> surface_bias;
};

/// @brief Sphere-tracing parameters
struct RaymarchSettings {
  std::uint32_t max_steps{128};        ///< Step budget per march
  double hit_epsilon{1.0e-4};          ///< |distance| below which the surface is hit
  double normal_epsilon{5.0e-4};       ///< Finite-difference offset for normals
  double step_clamp{0.95};             ///< Fraction of the distance advanced per step
  double max_travel_distance{1.0e5};   ///< Global travel cap along the ray
  double surface_bias{5.0e-4};         ///< Offset along the normal for rays leaving an SDF hit

  /// @brief Copy with overrides applied; values are clamped to usable ranges
  RaymarchSettings with_overrides(const RaymarchOverrides &overrides) const;
};

enum class RaymarchStatus {
  Hit,              ///< |distance| fell under hit_epsilon
  Miss,             ///< Marched through the valid interval without converging
  EscapedBounds,    ///< Ray does not overlap the object's bounds
  MaxStepsExceeded, ///< Step budget exhausted (or distance not finite)
};

std::string_view to_string(RaymarchStatus status);

/// @brief Signed-distance surface
class SdfObject {
public:
  virtual ~SdfObject() = default;

  /// @brief Signed distance at a world-space point (negative inside)
  virtual double signed_distance(const Vec3 &world_p) const = 0;

  virtual const Transform &object_to_world() const = 0;

  /// @brief Conservative world-space bounds
  virtual AABB world_bounds() const = 0;

  /// @brief Material used for shading; objects without one are never reported as hits
  virtual std::shared_ptr<const Material> material() const = 0;

  /// @brief Per-object replacement for the integrator's marching settings
  virtual std::optional<RaymarchSettings> custom_settings() const { return std::nullopt; }

  /// @brief Step multiplier in (0, 1], for fields that are not true distances
  virtual double step_scale() const { return 1.0; }

  /// @brief Analytic world-space gradient; finite differences are used otherwise
  virtual std::optional<Vec3> gradient(const Vec3 &) const { return std::nullopt; }

  /// @brief Per-object clamp on the travel distance
  virtual std::optional<double> max_raymarch_distance() const { return std::nullopt; }
};

struct RaymarchHit {
  double t{0.0};                             ///< Ray parameter at the hit
  Vec3 position;                             ///< World-space hit point
  Vec3 normal;                               ///< Unit gradient normal
  std::shared_ptr<const Material> material;  ///< May be null
  std::uint32_t steps{0};                    ///< Iterations taken
};

struct RaymarchResult {
  RaymarchStatus status{RaymarchStatus::Miss};
  std::optional<RaymarchHit> hit;

  static RaymarchResult miss(RaymarchStatus status) { return {status, std::nullopt}; }
  static RaymarchResult success(RaymarchHit hit) { return {RaymarchStatus::Hit, std::move(hit)}; }
};

/// @brief Sphere trace `ray` against one SDF object
RaymarchResult raymarch(const Ray &ray, const SdfObject &sdf, const RaymarchSettings &settings, RenderStats &stats);

/// @brief Unit surface normal at p from the distance field gradient
Vec3 compute_normal(const Vec3 &p, const SdfObject &sdf, double eps);

/// @brief Offset an SDF hit point along its normal by settings.surface_bias
Vec3 apply_surface_bias(const Vec3 &position, const Vec3 &normal, const RaymarchSettings &settings);

/// @brief Sphere of given radius around the origin of its object space
class SdfSphere : public SdfObject {
public:
  SdfSphere(const Transform &to_world, double radius, std::shared_ptr<const Material> material,
            std::optional<RaymarchSettings> settings = std::nullopt);

  double signed_distance(const Vec3 &world_p) const override;
  const Transform &object_to_world() const override { return to_world_; }
  AABB world_bounds() const override { return bounds_; }
  std::shared_ptr<const Material> material() const override { return material_; }
  std::optional<RaymarchSettings> custom_settings() const override { return settings_; }
  std::optional<Vec3> gradient(const Vec3 &world_p) const override;

private:
  Transform to_world_;
  Transform to_object_;
  double radius_;
  AABB bounds_;
  std::shared_ptr<const Material> material_;
  std::optional<RaymarchSettings> settings_;
};

} // namespace radiant::core
