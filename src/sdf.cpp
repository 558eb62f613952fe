#include <algorithm>
#include <cmath>
#include <limits>
#include <radiant/core/sdf.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/math/utils.hpp>
#include <stdexcept>

namespace radiant::core {

namespace {

constexpr double MIN_ADVANCE = 1.0e-7;

void record_status(RenderStats &stats, RaymarchStatus status) {
  switch (status) {
  case RaymarchStatus::Hit:
    stats.raymarch_hits += 1;
    break;
  case RaymarchStatus::Miss:
    stats.raymarch_misses += 1;
    break;
  case RaymarchStatus::EscapedBounds:
    stats.raymarch_escaped += 1;
    break;
  case RaymarchStatus::MaxStepsExceeded:
    stats.raymarch_exhausted += 1;
    break;
  }
}

RaymarchResult finish(RenderStats &stats, RaymarchResult result) {
  record_status(stats, result.status);
  return result;
}

} // namespace

RaymarchSettings RaymarchSettings::with_overrides(const RaymarchOverrides &overrides) const {
  RaymarchSettings merged = *this;

  if (overrides.max_steps)
    merged.max_steps = std::max<std::uint32_t>(*overrides.max_steps, 1);
  if (overrides.hit_epsilon)
    merged.hit_epsilon = std::max(*overrides.hit_epsilon, 1.0e-8);
  if (overrides.normal_epsilon)
    merged.normal_epsilon = std::max(*overrides.normal_epsilon, 1.0e-8);
  if (overrides.step_clamp)
    merged.step_clamp = std::clamp(*overrides.step_clamp, 1.0e-3, 1.0);
  if (overrides.max_travel_distance)
    merged.max_travel_distance = std::max(*overrides.max_travel_distance, 0.0);
  if (overrides.surface_bias)
    merged.surface_bias = std::max(*overrides.surface_bias, 0.0);

  return merged;
}

std::string_view to_string(RaymarchStatus status) {
  switch (status) {
  case RaymarchStatus::Hit:
    return "hit";
  case RaymarchStatus::Miss:
    return "miss";
  case RaymarchStatus::EscapedBounds:
    return "escaped_bounds";
  case RaymarchStatus::MaxStepsExceeded:
    return "max_steps_exceeded";
  }
  return "unknown";
}

RaymarchResult raymarch(const Ray &ray, const SdfObject &sdf, const RaymarchSettings &settings, RenderStats &stats) {
  const auto interval = sdf.world_bounds().clip(ray.o, ray.d, ray.tmin, ray.tmax);
  if (!interval)
    return finish(stats, RaymarchResult::miss(RaymarchStatus::EscapedBounds));

  double distance_cap = settings.max_travel_distance;
  if (auto object_cap = sdf.max_raymarch_distance())
    distance_cap = std::min(distance_cap, *object_cap);

  const double entry_t = std::max(interval->first, ray.tmin);
  const double exit_t = std::min({interval->second, ray.tmax, distance_cap});
  if (exit_t <= entry_t)
    return finish(stats, RaymarchResult::miss(RaymarchStatus::EscapedBounds));

  const double scale = std::clamp(sdf.step_scale(), std::numeric_limits<double>::min(), 1.0);

  double t = entry_t;
  std::uint32_t steps = 0;

  while (steps < settings.max_steps && t <= exit_t) {
    const Vec3 position = ray.point_at(t);
    const double distance = sdf.signed_distance(position);

    if (!std::isfinite(distance))
      return finish(stats, RaymarchResult::miss(RaymarchStatus::MaxStepsExceeded));

    if (std::abs(distance) <= settings.hit_epsilon) {
      RaymarchHit hit;
      hit.t = t;
      hit.position = position;
      hit.normal = compute_normal(position, sdf, settings.normal_epsilon);
      hit.material = sdf.material();
      hit.steps = steps;
      return finish(stats, RaymarchResult::success(std::move(hit)));
    }

    double step = distance * settings.step_clamp * scale;
    if (step <= 0.0)
      step = settings.hit_epsilon;
    step = std::max(step, MIN_ADVANCE);

    t += step;
    steps += 1;
    stats.raymarch_steps += 1;

    if (t > exit_t)
      return finish(stats, RaymarchResult::miss(RaymarchStatus::Miss));
  }

  if (steps >= settings.max_steps)
    return finish(stats, RaymarchResult::miss(RaymarchStatus::MaxStepsExceeded));
  return finish(stats, RaymarchResult::miss(RaymarchStatus::Miss));
}

Vec3 compute_normal(const Vec3 &p, const SdfObject &sdf, double eps) {
  Vec3 gradient;
  if (auto analytic = sdf.gradient(p)) {
    gradient = *analytic;
  } else {
    const double e = eps > 0.0 ? eps : 1.0e-4;
    const Vec3 ox{e, 0.0, 0.0};
    const Vec3 oy{0.0, e, 0.0};
    const Vec3 oz{0.0, 0.0, e};
    gradient = {sdf.signed_distance(p + ox) - sdf.signed_distance(p - ox),
                sdf.signed_distance(p + oy) - sdf.signed_distance(p - oy),
                sdf.signed_distance(p + oz) - sdf.signed_distance(p - oz)};
  }

  if (!is_finite(gradient))
    return Y_UNIT_VEC3;
  return safe_unit(gradient, Y_UNIT_VEC3, std::numeric_limits<double>::epsilon());
}

Vec3 apply_surface_bias(const Vec3 &position, const Vec3 &normal, const RaymarchSettings &settings) {
  if (norm2(normal) <= std::numeric_limits<double>::epsilon())
    return position;
  return position + normalize(normal) * settings.surface_bias;
}

SdfSphere::SdfSphere(const Transform &to_world, double radius, std::shared_ptr<const Material> material,
                     std::optional<RaymarchSettings> settings)
    : to_world_(to_world), to_object_(to_world.inverse()), radius_(radius),
      material_(std::move(material)), settings_(settings) {
  if (!(radius > 0.0)) {
    RLOG_ERROR("SdfSphere: radius must be positive, got {}", radius);
    throw std::invalid_argument("SdfSphere: radius must be positive");
  }

  // World bounds of the transformed object-space cube [-r, r]^3
  Vec3 lo{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
  Vec3 hi = -lo;
  for (int i = 0; i < 8; ++i) {
    const Vec3 corner{(i & 1) ? radius : -radius, (i & 2) ? radius : -radius, (i & 4) ? radius : -radius};
    const Vec3 w = to_world_.point(corner);
    for (int a = 0; a < 3; ++a) {
      lo[a] = std::min(lo[a], w[a]);
      hi[a] = std::max(hi[a], w[a]);
    }
  }
  bounds_ = AABB(lo, hi);
}

double SdfSphere::signed_distance(const Vec3 &world_p) const {
  // Exact for rigid transforms with uniform scale
  const double scale = std::cbrt(std::abs(to_world_.linear().determinant()));
  return (norm(to_object_.point(world_p)) - radius_) * scale;
}

std::optional<Vec3> SdfSphere::gradient(const Vec3 &world_p) const {
  const Vec3 local = to_object_.point(world_p);
  if (norm2(local) <= std::numeric_limits<double>::epsilon())
    return std::nullopt;
  return normalize(to_world_.normal(normalize(local)));
}

} // namespace radiant::core
