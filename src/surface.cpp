#include <limits>
#include <radiant/core/surface.hpp>
#include <radiant/math/utils.hpp>

namespace radiant::core {

namespace {

Vec3 valid_normal(const Vec3 &n) {
  if (!is_finite(n))
    return Y_UNIT_VEC3;
  return safe_unit(n, Y_UNIT_VEC3, std::numeric_limits<double>::epsilon());
}

} // namespace

double surface_hit_distance(const SurfaceHit &hit) {
  if (const auto *its = std::get_if<Intersection>(&hit))
    return its->t;
  return std::get<SdfSurfaceHit>(hit).raymarch.t;
}

std::optional<SurfaceHit> select_nearest(std::optional<Intersection> analytic, std::optional<SdfSurfaceHit> sdf) {
  if (analytic && sdf) {
    if (sdf->raymarch.t < analytic->t)
      return SurfaceHit{std::move(*sdf)};
    return SurfaceHit{std::move(*analytic)};
  }
  if (analytic)
    return SurfaceHit{std::move(*analytic)};
  if (sdf)
    return SurfaceHit{std::move(*sdf)};
  return std::nullopt;
}

std::optional<SurfaceHit> SurfaceSelection::into_nearest() && {
  return select_nearest(std::move(analytic_hit), std::move(sdf_hit));
}

std::optional<SdfSurfaceHit> gather_sdf_hit(const Ray &ray, const Scene &scene, const RaymarchSettings &settings,
                                            RenderStats &stats) {
  std::optional<SdfSurfaceHit> best;

  for (const auto &sdf : scene.sdf_objects) {
    const RaymarchSettings object_settings = sdf->custom_settings().value_or(settings);
    RaymarchResult result = raymarch(ray, *sdf, object_settings, stats);

    // Miss, EscapedBounds and MaxStepsExceeded leave the current best untouched
    if (result.status != RaymarchStatus::Hit || !result.hit || !result.hit->material)
      continue;

    if (!best || result.hit->t < best->raymarch.t) {
      std::shared_ptr<const Material> material = result.hit->material;
      best = SdfSurfaceHit{sdf, std::move(*result.hit), std::move(material)};
    }
  }

  return best;
}

SurfaceSelection collect_surface_hits(const Ray &ray, const Scene &scene, const RaymarchSettings &settings,
                                      RenderStats &stats, bool include_sdf) {
  stats.traced_rays += 1;

  SurfaceSelection selection;
  selection.analytic_hit = scene.root.hit(ray, stats);
  if (include_sdf)
    selection.sdf_hit = gather_sdf_hit(ray, scene, settings, stats);
  return selection;
}

bool surface_hit_has_emission(const SurfaceHit &hit) {
  if (const auto *its = std::get_if<Intersection>(&hit))
    return its->material->have_emission();
  return std::get<SdfSurfaceHit>(hit).material->have_emission();
}

Color3 surface_hit_emission(const SurfaceHit &hit, const Vec3 &incoming_world) {
  if (const auto *its = std::get_if<Intersection>(&hit)) {
    const Frame frame(its->n);
    return its->material->emission(frame.to_local(incoming_world));
  }

  const auto &sdf_hit = std::get<SdfSurfaceHit>(hit);
  const Frame frame(valid_normal(sdf_hit.raymarch.normal));
  return sdf_hit.material->emission(frame.to_local(incoming_world));
}

SurfaceContext::SurfaceContext(const Vec3 &position, const Vec3 &normal, std::shared_ptr<const Material> owned,
                               const Material *material, bool is_sdf)
    : position(position), normal(normal), owned_(std::move(owned)), material_(material), is_sdf_(is_sdf) {}

SurfaceContext SurfaceContext::from_hit(const SurfaceHit &hit) {
  if (const auto *its = std::get_if<Intersection>(&hit))
    return SurfaceContext(its->p, normalize(its->n), nullptr, its->material, false);

  const auto &sdf_hit = std::get<SdfSurfaceHit>(hit);
  return SurfaceContext(sdf_hit.raymarch.position, valid_normal(sdf_hit.raymarch.normal), sdf_hit.material,
                        sdf_hit.material.get(), true);
}

Vec3 SurfaceContext::spawn_origin(const RaymarchSettings &settings) const {
  if (is_sdf_)
    return apply_surface_bias(position, normal, settings);
  return position;
}

} // namespace radiant::core
