#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <radiant/core/material.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/surface.hpp>
#include <stdexcept>

using namespace radiant::core;

namespace {

// Sphere without an analytic gradient, with a box of half size `half_extent` around its centre
class LooseSphere : public SdfObject {
public:
  LooseSphere(const Vec3 &center, double radius, double half_extent, std::shared_ptr<const Material> material,
              std::optional<RaymarchSettings> settings = std::nullopt)
      : center_(center), radius_(radius), to_world_(Transform::translate(center)),
        bounds_(center - Vec3{half_extent, half_extent, half_extent}, center + Vec3{half_extent, half_extent, half_extent}),
        material_(std::move(material)), settings_(settings) {}

  double signed_distance(const Vec3 &p) const override { return norm(p - center_) - radius_; }
  const Transform &object_to_world() const override { return to_world_; }
  AABB world_bounds() const override { return bounds_; }
  std::shared_ptr<const Material> material() const override { return material_; }
  std::optional<RaymarchSettings> custom_settings() const override { return settings_; }

  std::optional<double> max_distance;
  std::optional<double> max_raymarch_distance() const override { return max_distance; }

  double scale{1.0};
  double step_scale() const override { return scale; }

private:
  Vec3 center_;
  double radius_;
  Transform to_world_;
  AABB bounds_;
  std::shared_ptr<const Material> material_;
  std::optional<RaymarchSettings> settings_;
};

class BrokenField : public LooseSphere {
public:
  using LooseSphere::LooseSphere;
  double signed_distance(const Vec3 &) const override { return std::numeric_limits<double>::quiet_NaN(); }
};

std::shared_ptr<const Material> grey() {
  return std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5});
}

} // namespace

TEST(Raymarch, HitsUnitSphereAtDistanceNine) {
  const LooseSphere sphere({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  const RaymarchSettings settings;
  RenderStats stats;

  const RaymarchResult result = raymarch(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), sphere, settings, stats);
  ASSERT_EQ(result.status, RaymarchStatus::Hit);
  ASSERT_TRUE(result.hit.has_value());
  EXPECT_LE(std::abs(result.hit->t - 9.0), settings.hit_epsilon);
  EXPECT_NEAR(result.hit->normal.z, -1.0, 1e-6);
  EXPECT_GT(result.hit->steps, 0u);
  EXPECT_EQ(stats.raymarch_hits, 1u);
  EXPECT_EQ(stats.raymarch_steps, result.hit->steps);
}

TEST(Raymarch, StepScaleShortensSteps) {
  LooseSphere full({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  LooseSphere halved({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  halved.scale = 0.5;
  const RaymarchSettings settings;
  RenderStats stats;
  const Ray ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3);

  const RaymarchResult fast = raymarch(ray, full, settings, stats);
  const RaymarchResult slow = raymarch(ray, halved, settings, stats);
  ASSERT_EQ(fast.status, RaymarchStatus::Hit);
  ASSERT_EQ(slow.status, RaymarchStatus::Hit);
  EXPECT_LE(std::abs(slow.hit->t - 9.0), settings.hit_epsilon);
  EXPECT_GT(slow.hit->steps, fast.hit->steps);
  EXPECT_LT(slow.hit->steps, settings.max_steps);
}

TEST(Raymarch, StepBudgetExhaustion) {
  const LooseSphere sphere({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  RaymarchSettings settings;
  settings.max_steps = 2;
  RenderStats stats;

  const RaymarchResult result = raymarch(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), sphere, settings, stats);
  EXPECT_EQ(result.status, RaymarchStatus::MaxStepsExceeded);
  EXPECT_FALSE(result.hit.has_value());
  EXPECT_EQ(stats.raymarch_exhausted, 1u);
}

TEST(Raymarch, GrazingRayMisses) {
  const LooseSphere sphere({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  RenderStats stats;
  const RaymarchResult result = raymarch(Ray({0.0, 1.5, 0.0}, Z_UNIT_VEC3), sphere, RaymarchSettings{}, stats);
  EXPECT_EQ(result.status, RaymarchStatus::Miss);
  EXPECT_EQ(stats.raymarch_misses, 1u);
}

TEST(Raymarch, RayOutsideBoundsEscapes) {
  const LooseSphere sphere({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  RenderStats stats;
  const RaymarchResult result = raymarch(Ray({5.0, 0.0, 0.0}, Z_UNIT_VEC3), sphere, RaymarchSettings{}, stats);
  EXPECT_EQ(result.status, RaymarchStatus::EscapedBounds);
  EXPECT_EQ(stats.raymarch_steps, 0u);
  EXPECT_EQ(stats.raymarch_escaped, 1u);
}

TEST(Raymarch, TravelCapsShortenTheInterval) {
  LooseSphere sphere({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  RenderStats stats;

  RaymarchSettings capped;
  capped.max_travel_distance = 5.0;
  EXPECT_EQ(raymarch(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), sphere, capped, stats).status, RaymarchStatus::EscapedBounds);

  sphere.max_distance = 8.5;
  EXPECT_EQ(raymarch(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), sphere, RaymarchSettings{}, stats).status,
            RaymarchStatus::Miss);

  const Ray short_ray = Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3).with_distance_max(6.0);
  EXPECT_EQ(raymarch(short_ray, sphere, RaymarchSettings{}, stats).status, RaymarchStatus::EscapedBounds);
}

TEST(Raymarch, NonFiniteDistanceStopsTheMarch) {
  const BrokenField field({0.0, 0.0, 10.0}, 1.0, 3.0, grey());
  RenderStats stats;
  const RaymarchResult result = raymarch(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), field, RaymarchSettings{}, stats);
  EXPECT_EQ(result.status, RaymarchStatus::MaxStepsExceeded);
}

TEST(Raymarch, SettingsOverridesAreClamped) {
  RaymarchOverrides overrides;
  overrides.max_steps = 0;
  overrides.hit_epsilon = 0.0;
  overrides.normal_epsilon = -1.0;
  overrides.step_clamp = 5.0;
  overrides.max_travel_distance = -3.0;
  overrides.surface_bias = -1.0;

  const RaymarchSettings s = RaymarchSettings{}.with_overrides(overrides);
  EXPECT_EQ(s.max_steps, 1u);
  EXPECT_EQ(s.hit_epsilon, 1e-8);
  EXPECT_EQ(s.normal_epsilon, 1e-8);
  EXPECT_EQ(s.step_clamp, 1.0);
  EXPECT_EQ(s.max_travel_distance, 0.0);
  EXPECT_EQ(s.surface_bias, 0.0);

  RaymarchOverrides partial;
  partial.step_clamp = 0.0;
  const RaymarchSettings p = RaymarchSettings{}.with_overrides(partial);
  EXPECT_EQ(p.step_clamp, 1e-3);
  EXPECT_EQ(p.max_steps, RaymarchSettings{}.max_steps);
}

TEST(Raymarch, StatusNames) {
  EXPECT_EQ(to_string(RaymarchStatus::Hit), "hit");
  EXPECT_EQ(to_string(RaymarchStatus::MaxStepsExceeded), "max_steps_exceeded");
}

TEST(ComputeNormal, CentralDifferencesAndAnalyticGradientAgree) {
  const Vec3 center{1.0, -2.0, 3.0};
  const LooseSphere loose(center, 2.0, 3.0, grey());
  const SdfSphere exact(Transform::translate(center), 2.0, grey());

  const Vec3 p = center + normalize(Vec3{1.0, 2.0, 2.0}) * 2.0;
  const Vec3 n_fd = compute_normal(p, loose, 5e-4);
  const Vec3 n_an = compute_normal(p, exact, 5e-4);
  const Vec3 expected = normalize(Vec3{1.0, 2.0, 2.0});
  EXPECT_NEAR(dot(n_fd, expected), 1.0, 1e-6);
  EXPECT_NEAR(dot(n_an, expected), 1.0, 1e-12);
}

TEST(ComputeNormal, DegenerateGradientFallsBackToUp) {
  const LooseSphere sphere({0.0, 0.0, 0.0}, 1.0, 2.0, grey());
  // The field is symmetric around the centre, so the differences cancel
  const Vec3 n = compute_normal({0.0, 0.0, 0.0}, sphere, 1e-3);
  EXPECT_EQ(n.x, 0.0);
  EXPECT_EQ(n.y, 1.0);
  EXPECT_EQ(n.z, 0.0);
}

TEST(SurfaceBias, OffsetsAlongNormal) {
  RaymarchSettings settings;
  settings.surface_bias = 0.01;
  const Vec3 p = apply_surface_bias({1.0, 1.0, 1.0}, {0.0, 0.0, 2.0}, settings);
  EXPECT_DOUBLE_EQ(p.z, 1.01);
  const Vec3 q = apply_surface_bias({1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}, settings);
  EXPECT_EQ(q.z, 1.0);
}

TEST(SdfSphere, BoundsFollowTransform) {
  const SdfSphere sphere(Transform::translate({0.0, 0.0, 10.0}) * Transform::scale({2.0, 2.0, 2.0}), 1.0, grey());
  const AABB b = sphere.world_bounds();
  EXPECT_NEAR(b.min.z, 8.0, 1e-12);
  EXPECT_NEAR(b.max.x, 2.0, 1e-12);
  EXPECT_NEAR(sphere.signed_distance({0.0, 0.0, 0.0}), 8.0, 1e-12);
  EXPECT_THROW(SdfSphere(Transform(), 0.0, grey()), std::invalid_argument);
}

TEST(GatherSdfHit, ExhaustedObjectDoesNotHideFartherHit) {
  Scene scene;
  RaymarchSettings tight;
  tight.max_steps = 1;
  scene.add_sdf_object(std::make_shared<LooseSphere>(Vec3{0.0, 0.0, 5.0}, 1.0, 3.0, grey(), tight));
  auto far = std::make_shared<SdfSphere>(Transform::translate({0.0, 0.0, 10.0}), 1.0, grey());
  scene.add_sdf_object(far);

  RenderStats stats;
  const auto hit = gather_sdf_hit(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), scene, RaymarchSettings{}, stats);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->sdf.get(), far.get());
  EXPECT_NEAR(hit->raymarch.t, 9.0, 1e-4);
  EXPECT_EQ(stats.raymarch_exhausted, 1u);
}

TEST(GatherSdfHit, ClosestOfSeveralHitsWins) {
  Scene scene;
  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({0.0, 0.0, 10.0}), 1.0, grey()));
  auto near = std::make_shared<LooseSphere>(Vec3{0.0, 0.0, 5.0}, 1.0, 3.0, grey());
  scene.add_sdf_object(near);

  RenderStats stats;
  const auto hit = gather_sdf_hit(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), scene, RaymarchSettings{}, stats);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->sdf.get(), near.get());
  EXPECT_NEAR(hit->raymarch.t, 4.0, 1e-4);
}

TEST(GatherSdfHit, ObjectsWithoutMaterialAreIgnored) {
  Scene scene;
  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({0.0, 0.0, 5.0}), 1.0, nullptr));
  RenderStats stats;
  EXPECT_FALSE(gather_sdf_hit(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), scene, RaymarchSettings{}, stats).has_value());
  EXPECT_EQ(stats.raymarch_hits, 1u);
}
