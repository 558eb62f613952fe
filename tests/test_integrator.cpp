#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <radiant/core/integrator.hpp>
#include <radiant/core/material.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/shape.hpp>
#include <radiant/math/utils.hpp>
#include <radiant/sample/sampler.hpp>
#include <stdexcept>

using namespace radiant::core;
using radiant::sample::IndependentSampler;

namespace {

// Diffuse receiver at z = -5 facing +z, emitter at z = +1 facing -z
Scene two_quad_scene(const Color3 &background) {
  Scene scene;
  scene.background_color = background;
  scene.root.add_shape(std::make_unique<Quad>(Transform::translate({0.0, 0.0, -5.0}), Vec2(4.0, 4.0),
                                              std::make_shared<Diffuse>(Color3{0.7, 0.6, 0.5})));
  scene.root.add_shape(std::make_unique<Quad>(Transform::translate({0.0, 0.0, 1.0}) *
                                                  Transform::rotate(X_UNIT_VEC3, 180.0),
                                              Vec2(2.0, 2.0), std::make_shared<DiffuseEmitter>(Color3{5.0, 5.0, 5.0})));
  return scene;
}

// Receiver at z = 0 facing +z, under a 2x2 emitter of unit radiance at z = 1 facing -z
Scene receiver_under_light(std::shared_ptr<const Material> receiver) {
  Scene scene;
  scene.background_color = {0.0, 0.0, 0.0};
  scene.root.add_shape(std::make_unique<Quad>(Transform(), Vec2(4.0, 4.0), std::move(receiver)));
  scene.root.add_shape(std::make_unique<Quad>(Transform::translate({0.0, 0.0, 1.0}) *
                                                  Transform::rotate(X_UNIT_VEC3, 180.0),
                                              Vec2(2.0, 2.0), std::make_shared<DiffuseEmitter>(Color3{1.0, 1.0, 1.0})));
  return scene;
}

// Same setup with a non-emissive SDF sphere below the receiver, so hybrid queries march it
Scene receiver_under_light_with_sdf(std::shared_ptr<const Material> receiver) {
  Scene scene = receiver_under_light(std::move(receiver));
  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({0.0, 0.0, -3.0}), 1.0,
                                                   std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5})));
  return scene;
}

// Radiance reflected at the centre of a receiver of albedo 0.5: albedo times
// the point-to-square form factor, built from four unit quadrants at unit height
double expected_receiver_radiance() {
  const double a = 1.0 / std::sqrt(2.0);
  const double quadrant = 2.0 * a * std::atan(a) / (2.0 * PI);
  return 0.5 * 4.0 * quadrant;
}

double mean_receiver_radiance(const Integrator &integrator, const Scene &scene, std::size_t n, std::uint64_t seed) {
  IndependentSampler sampler(seed, 1);
  RenderStats stats;
  const Ray ray({0.0, 0.0, 0.5}, -Z_UNIT_VEC3);
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i)
    sum += integrator.li(ray, scene, sampler, stats).x;
  return sum / static_cast<double>(n);
}

// Several standard errors of the noisiest estimators at this sample count
constexpr std::size_t CONVERGENCE_SAMPLES = 400000;
constexpr double CONVERGENCE_TOL = 5e-3;

} // namespace

TEST(BalanceHeuristic, EqualDensitiesGiveOneHalf) {
  EXPECT_EQ(balance_heuristic(2.0, 2.0), 0.5);
  EXPECT_DOUBLE_EQ(balance_heuristic(3.0, 1.0), 0.75);
}

TEST(BalanceHeuristic, VanishingDensitiesGiveZero) {
  EXPECT_EQ(balance_heuristic(0.0, 0.0), 0.0);
  EXPECT_EQ(balance_heuristic(-1.0, 0.5), 0.0);
}

TEST(MakeIntegrator, KnownAndUnknownTypes) {
  EXPECT_NE(dynamic_cast<PathMisIntegrator *>(make_integrator("path_mis").get()), nullptr);
  EXPECT_NE(dynamic_cast<NormalIntegrator *>(make_integrator("normal").get()), nullptr);

  const auto analytic = make_integrator("path_mis");
  EXPECT_EQ(dynamic_cast<const PathMisIntegrator &>(*analytic).config().mode, GeometryMode::Analytic);
  const auto hybrid = make_integrator("sdf_path_mis", IntegratorConfig(4, GeometryMode::Analytic));
  EXPECT_EQ(dynamic_cast<const PathMisIntegrator &>(*hybrid).config().mode, GeometryMode::Hybrid);
  EXPECT_EQ(dynamic_cast<const PathMisIntegrator &>(*hybrid).config().max_depth, 4u);

  EXPECT_THROW(make_integrator("bidirectional"), std::invalid_argument);
}

TEST(MakeIntegrator, DirectAndPathFamilies) {
  const auto direct = make_integrator("direct", IntegratorConfig(4, GeometryMode::Hybrid));
  EXPECT_EQ(dynamic_cast<const DirectIntegrator &>(*direct).config().mode, GeometryMode::Analytic);
  for (const char *name : {"sdf_direct", "hybrid_direct"}) {
    const auto hybrid = make_integrator(name, IntegratorConfig(4, GeometryMode::Analytic));
    EXPECT_EQ(dynamic_cast<const DirectIntegrator &>(*hybrid).config().mode, GeometryMode::Hybrid) << name;
  }

  const auto path = make_integrator("path");
  EXPECT_EQ(dynamic_cast<const PathIntegrator &>(*path).config().mode, GeometryMode::Analytic);
  const auto hybrid_path = make_integrator("hybrid_path");
  EXPECT_EQ(dynamic_cast<const PathIntegrator &>(*hybrid_path).config().mode, GeometryMode::Hybrid);
}

TEST(ParseDirectStrategy, NamesAndErrors) {
  EXPECT_EQ(parse_direct_strategy("bsdf"), DirectStrategy::Bsdf);
  EXPECT_EQ(parse_direct_strategy("naive"), DirectStrategy::Naive);
  EXPECT_EQ(parse_direct_strategy("emitter"), DirectStrategy::Emitter);
  EXPECT_EQ(parse_direct_strategy("mis"), DirectStrategy::Mis);
  EXPECT_THROW(parse_direct_strategy("MIS"), std::invalid_argument);
  EXPECT_EQ(IntegratorConfig{}.strategy, DirectStrategy::Bsdf);
}

TEST(PathMisIntegrator, EscapingRayReturnsBackground) {
  const Scene scene = two_quad_scene({0.1, 0.2, 0.3});
  const PathMisIntegrator integrator(IntegratorConfig{});
  IndependentSampler sampler(1, 1);
  RenderStats stats;

  const Color3 l = integrator.li(Ray({0.0, 0.0, 0.0}, X_UNIT_VEC3), scene, sampler, stats);
  EXPECT_EQ(l.x, 0.1);
  EXPECT_EQ(l.y, 0.2);
  EXPECT_EQ(l.z, 0.3);
  EXPECT_EQ(stats.traced_rays, 1u);
}

TEST(PathMisIntegrator, DirectViewOfEmitterReturnsItsRadiance) {
  const Scene scene = two_quad_scene({0.0, 0.0, 0.0});
  const PathMisIntegrator integrator(IntegratorConfig{});
  IndependentSampler sampler(1, 1);
  RenderStats stats;

  // Emitter does not scatter, so the path ends at the first vertex
  const Color3 l = integrator.li(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), scene, sampler, stats);
  EXPECT_EQ(l.x, 5.0);
  EXPECT_EQ(l.z, 5.0);
}

TEST(PathMisIntegrator, ReceiverSeesLight) {
  const Scene scene = two_quad_scene({0.0, 0.0, 0.0});
  const PathMisIntegrator integrator(IntegratorConfig{});
  IndependentSampler sampler(9, 1);
  RenderStats stats;

  for (int i = 0; i < 16; ++i) {
    const Color3 l = integrator.li(Ray({0.0, 0.0, 0.0}, -Z_UNIT_VEC3), scene, sampler, stats);
    EXPECT_GT(l.x, 0.0);
    EXPECT_GT(l.y, 0.0);
    EXPECT_GT(l.z, 0.0);
  }
  EXPECT_GT(stats.intersections, 0u);
}

TEST(PathMisIntegrator, ZeroDepthGathersNothing) {
  const Scene scene = two_quad_scene({1.0, 1.0, 1.0});
  const PathMisIntegrator integrator(IntegratorConfig(0, GeometryMode::Analytic));
  IndependentSampler sampler(1, 1);
  RenderStats stats;
  const Color3 l = integrator.li(Ray({0.0, 0.0, 0.0}, X_UNIT_VEC3), scene, sampler, stats);
  EXPECT_EQ(l.x, 0.0);
}

TEST(PathMisIntegrator, AnalyticModeIgnoresSdfObjects) {
  Scene scene = two_quad_scene({0.25, 0.25, 0.25});
  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({3.0, 0.0, 0.0}), 1.0,
                                                   std::make_shared<DiffuseEmitter>(Color3{7.0, 7.0, 7.0})));
  IndependentSampler sampler(1, 1);
  RenderStats stats;
  const Ray ray({0.0, 0.0, 0.0}, X_UNIT_VEC3);

  EXPECT_EQ(make_integrator("path_mis")->li(ray, scene, sampler, stats).x, 0.25);
  EXPECT_EQ(make_integrator("hybrid_path_mis")->li(ray, scene, sampler, stats).x, 7.0);
}

TEST(DirectEmitterMis, NoLightOrDeltaMaterialGivesZero) {
  Scene dark;
  dark.root.add_shape(std::make_unique<Quad>(Transform(), Vec2(1.0, 1.0),
                                             std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5})));
  const Scene lit = two_quad_scene({0.0, 0.0, 0.0});
  IndependentSampler sampler(1, 1);
  RenderStats stats;
  const IntegratorConfig config;

  Intersection its;
  its.p = {0.0, 0.0, -5.0};
  its.n = Z_UNIT_VEC3;
  const Diffuse diffuse({0.5, 0.5, 0.5});
  const Mirror mirror({1.0, 1.0, 1.0});
  const Frame frame(its.n);
  const Vec3 wo = Z_UNIT_VEC3;

  its.material = &diffuse;
  const SurfaceContext diffuse_ctx = SurfaceContext::from_hit(its);
  EXPECT_EQ(direct_emitter_mis(diffuse_ctx, dark, sampler, frame, wo, config, stats).x, 0.0);
  EXPECT_GT(direct_emitter_mis(diffuse_ctx, lit, sampler, frame, wo, config, stats).x, 0.0);

  its.material = &mirror;
  const SurfaceContext mirror_ctx = SurfaceContext::from_hit(its);
  EXPECT_EQ(direct_emitter_mis(mirror_ctx, lit, sampler, frame, wo, config, stats).x, 0.0);
}

TEST(DirectEmitterMis, OccludedLightGivesZero) {
  Scene scene = two_quad_scene({0.0, 0.0, 0.0});
  // Large blocker between receiver and light
  scene.root.add_shape(std::make_unique<Quad>(Transform::translate({0.0, 0.0, -2.0}), Vec2(10.0, 10.0),
                                              std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5})));
  IndependentSampler sampler(1, 1);
  RenderStats stats;

  Intersection its;
  its.p = {0.0, 0.0, -5.0};
  its.n = Z_UNIT_VEC3;
  const Diffuse diffuse({0.5, 0.5, 0.5});
  its.material = &diffuse;
  const SurfaceContext ctx = SurfaceContext::from_hit(its);

  for (int i = 0; i < 8; ++i) {
    const Color3 d = direct_emitter_mis(ctx, scene, sampler, Frame(its.n), Z_UNIT_VEC3, IntegratorConfig{}, stats);
    EXPECT_EQ(d.x, 0.0);
  }
}

TEST(NormalIntegrator, MapsNormalToUnitCube) {
  const Scene scene = two_quad_scene({0.0, 0.0, 0.0});
  const auto integrator = make_integrator("normal");
  IndependentSampler sampler(1, 1);
  RenderStats stats;

  const Color3 n = integrator->li(Ray({0.0, 0.0, 0.0}, -Z_UNIT_VEC3), scene, sampler, stats);
  EXPECT_DOUBLE_EQ(n.x, 0.5);
  EXPECT_DOUBLE_EQ(n.y, 0.5);
  EXPECT_DOUBLE_EQ(n.z, 1.0);
  EXPECT_EQ(integrator->li(Ray({0.0, 0.0, 0.0}, X_UNIT_VEC3), scene, sampler, stats).x, 0.0);
}

TEST(PathMisIntegrator, ReceiverRadianceConvergesToFormFactor) {
  const double expected = expected_receiver_radiance();
  const auto receiver = std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5});
  const Scene analytic_scene = receiver_under_light(receiver);
  const Scene hybrid_scene = receiver_under_light_with_sdf(receiver);

  // Depth 1 sees only the first vertex; deeper paths must not count the emitter twice
  for (std::size_t depth : {1u, 2u, 5u}) {
    const auto analytic = make_integrator("path_mis", IntegratorConfig(depth, GeometryMode::Analytic));
    EXPECT_NEAR(mean_receiver_radiance(*analytic, analytic_scene, CONVERGENCE_SAMPLES, 17), expected,
                CONVERGENCE_TOL)
        << "depth " << depth;

    const auto hybrid = make_integrator("sdf_path_mis", IntegratorConfig(depth, GeometryMode::Hybrid));
    EXPECT_NEAR(mean_receiver_radiance(*hybrid, hybrid_scene, CONVERGENCE_SAMPLES, 23), expected, CONVERGENCE_TOL)
        << "depth " << depth;
  }
}

TEST(PathMisIntegrator, MirrorOverEmitterKeepsFullWeight) {
  const Scene scene = receiver_under_light(std::make_shared<Mirror>(Color3{0.8, 0.8, 0.8}));
  IndependentSampler sampler(3, 1);
  RenderStats stats;
  const Ray ray({0.0, 0.0, 0.5}, -Z_UNIT_VEC3);

  for (const char *name : {"path_mis", "hybrid_path_mis"}) {
    const auto integrator = make_integrator(name, IntegratorConfig(5, GeometryMode::Hybrid));
    const Color3 l = integrator->li(ray, scene, sampler, stats);
    EXPECT_DOUBLE_EQ(l.x, 0.8) << name;
    EXPECT_DOUBLE_EQ(l.z, 0.8) << name;
  }
}

TEST(DirectIntegrator, EveryStrategyConvergesToFormFactor) {
  const double expected = expected_receiver_radiance();
  const auto receiver = std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5});
  const Scene analytic_scene = receiver_under_light(receiver);
  const Scene hybrid_scene = receiver_under_light_with_sdf(receiver);

  std::uint64_t seed = 31;
  for (DirectStrategy strategy :
       {DirectStrategy::Bsdf, DirectStrategy::Naive, DirectStrategy::Emitter, DirectStrategy::Mis}) {
    IntegratorConfig config;
    config.strategy = strategy;

    const auto analytic = make_integrator("direct", config);
    EXPECT_NEAR(mean_receiver_radiance(*analytic, analytic_scene, CONVERGENCE_SAMPLES, seed++), expected,
                CONVERGENCE_TOL)
        << "strategy " << static_cast<int>(strategy);

    const auto hybrid = make_integrator("hybrid_direct", config);
    EXPECT_NEAR(mean_receiver_radiance(*hybrid, hybrid_scene, CONVERGENCE_SAMPLES, seed++), expected,
                CONVERGENCE_TOL)
        << "strategy " << static_cast<int>(strategy);
  }
}

TEST(DirectIntegrator, EmitterAndBackgroundSeenDirectly) {
  const Scene scene = two_quad_scene({0.1, 0.2, 0.3});
  IndependentSampler sampler(1, 1);
  RenderStats stats;

  for (DirectStrategy strategy : {DirectStrategy::Bsdf, DirectStrategy::Mis}) {
    IntegratorConfig config;
    config.strategy = strategy;
    const DirectIntegrator integrator(config);

    EXPECT_EQ(integrator.li(Ray({0.0, 0.0, 0.0}, Z_UNIT_VEC3), scene, sampler, stats).x, 5.0);
    const Color3 bg = integrator.li(Ray({0.0, 0.0, 0.0}, X_UNIT_VEC3), scene, sampler, stats);
    EXPECT_EQ(bg.x, 0.1);
    EXPECT_EQ(bg.z, 0.3);
  }
}

TEST(DirectIntegrator, MisOverMirrorIsExact) {
  const Scene scene = receiver_under_light(std::make_shared<Mirror>(Color3{0.8, 0.8, 0.8}));
  IntegratorConfig config;
  config.strategy = DirectStrategy::Mis;
  const auto integrator = make_integrator("direct", config);
  IndependentSampler sampler(5, 1);
  RenderStats stats;

  for (int i = 0; i < 4; ++i)
    EXPECT_DOUBLE_EQ(integrator->li(Ray({0.0, 0.0, 0.5}, -Z_UNIT_VEC3), scene, sampler, stats).x, 0.8);
}

TEST(DirectIntegrator, EmitterStrategyIsDarkWithoutAnalyticLights) {
  Scene scene;
  scene.root.add_shape(std::make_unique<Quad>(Transform(), Vec2(4.0, 4.0),
                                              std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5})));
  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({0.0, 0.0, 2.0}), 1.0,
                                                   std::make_shared<DiffuseEmitter>(Color3{4.0, 4.0, 4.0})));
  IntegratorConfig config;
  config.strategy = DirectStrategy::Emitter;
  const auto integrator = make_integrator("hybrid_direct", config);
  IndependentSampler sampler(8, 1);
  RenderStats stats;

  for (int i = 0; i < 32; ++i)
    EXPECT_EQ(integrator->li(Ray({0.5, 0.5, 0.5}, -Z_UNIT_VEC3), scene, sampler, stats).x, 0.0);
}

TEST(PathIntegrator, ReceiverRadianceConvergesToFormFactor) {
  const double expected = expected_receiver_radiance();
  const auto receiver = std::make_shared<Diffuse>(Color3{0.5, 0.5, 0.5});

  const auto analytic = make_integrator("path", IntegratorConfig(5, GeometryMode::Analytic));
  EXPECT_NEAR(mean_receiver_radiance(*analytic, receiver_under_light(receiver), CONVERGENCE_SAMPLES, 41), expected,
              CONVERGENCE_TOL);

  const auto hybrid = make_integrator("hybrid_path", IntegratorConfig(5, GeometryMode::Hybrid));
  EXPECT_NEAR(mean_receiver_radiance(*hybrid, receiver_under_light_with_sdf(receiver), CONVERGENCE_SAMPLES, 43),
              expected, CONVERGENCE_TOL);
}

TEST(PathIntegrator, DepthLimitsBounces) {
  const Scene scene = receiver_under_light(std::make_shared<Mirror>(Color3{0.8, 0.8, 0.8}));
  IndependentSampler sampler(2, 1);
  RenderStats stats;
  const Ray ray({0.0, 0.0, 0.5}, -Z_UNIT_VEC3);

  // Mirror, then emitter: two vertices are needed to reach the light
  EXPECT_EQ(PathIntegrator(IntegratorConfig(1, GeometryMode::Analytic)).li(ray, scene, sampler, stats).x, 0.0);
  EXPECT_DOUBLE_EQ(PathIntegrator(IntegratorConfig(2, GeometryMode::Analytic)).li(ray, scene, sampler, stats).x, 0.8);
}
