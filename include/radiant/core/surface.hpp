#pragma once
#include <memory>
#include <optional>
#include <radiant/core/material.hpp>
#include <radiant/core/ray.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/shape.hpp>
#include <radiant/core/stats.hpp>
#include <radiant/math/vec.hpp>
#include <variant>

using namespace radiant::math;

namespace radiant::core {

/// @brief Implicit surface that won the depth test
struct SdfSurfaceHit {
  std::shared_ptr<const SdfObject> sdf;     ///< Object that was marched
  RaymarchHit raymarch;                     ///< Raw marching result
  std::shared_ptr<const Material> material; ///< Never null
};

/// @brief Nearest surface along a ray, analytic or implicit
using SurfaceHit = std::variant<Intersection, SdfSurfaceHit>;

/// @brief Distance along the ray of either hit kind
double surface_hit_distance(const SurfaceHit &hit);

/// @brief Nearest of two candidates; the implicit hit wins only when strictly closer
std::optional<SurfaceHit> select_nearest(std::optional<Intersection> analytic, std::optional<SdfSurfaceHit> sdf);

/// @brief Both surface candidates found for one ray
struct SurfaceSelection {
  std::optional<Intersection> analytic_hit;
  std::optional<SdfSurfaceHit> sdf_hit;

  bool is_empty() const { return !analytic_hit && !sdf_hit; }

  /// @brief Consume the selection, keeping the closest candidate
  std::optional<SurfaceHit> into_nearest() &&;

  const Intersection *analytic() const { return analytic_hit ? &*analytic_hit : nullptr; }
  const SdfSurfaceHit *sdf() const { return sdf_hit ? &*sdf_hit : nullptr; }
};

/// @brief Closest successful march over all SDF objects of the scene
///
/// Each object is marched with its custom settings when it has any. Hits
/// without a material are ignored, and an object that exhausts its step
/// budget never hides a hit found on another object.
std::optional<SdfSurfaceHit> gather_sdf_hit(const Ray &ray, const Scene &scene, const RaymarchSettings &settings,
                                            RenderStats &stats);

/// @brief Query analytic geometry and, when `include_sdf` is set, the SDF objects
SurfaceSelection collect_surface_hits(const Ray &ray, const Scene &scene, const RaymarchSettings &settings,
                                      RenderStats &stats, bool include_sdf = true);

bool surface_hit_has_emission(const SurfaceHit &hit);

/// @brief Radiance leaving the hit surface along `incoming_world`, the
/// reversed ray direction
Color3 surface_hit_emission(const SurfaceHit &hit, const Vec3 &incoming_world);

/// @brief Shading data common to both hit kinds
class SurfaceContext {
public:
  static SurfaceContext from_hit(const SurfaceHit &hit);

  const Material &material() const { return *material_; }
  bool is_sdf() const { return is_sdf_; }

  /// @brief Origin for rays leaving the surface; implicit hits are pushed off
  /// along the normal by the surface bias
  Vec3 spawn_origin(const RaymarchSettings &settings) const;

  Vec3 position;
  Vec3 normal; ///< Unit length

private:
  SurfaceContext(const Vec3 &position, const Vec3 &normal, std::shared_ptr<const Material> owned,
                 const Material *material, bool is_sdf);

  std::shared_ptr<const Material> owned_; ///< Keeps implicit materials alive
  const Material *material_;
  bool is_sdf_;
};

} // namespace radiant::core
