#include <radiant/core/integrator.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/math/utils.hpp>
#include <radiant/sample/warp.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace radiant::core {

namespace {

std::optional<SurfaceHit> nearest_surface(const Ray &ray, const Scene &scene, const IntegratorConfig &config,
                                          RenderStats &stats) {
  const bool include_sdf = config.mode == GeometryMode::Hybrid;
  return collect_surface_hits(ray, scene, config.sdf_settings, stats, include_sdf).into_nearest();
}

constexpr double RR_MIN_PROB = 0.05;
constexpr double RR_MAX_PROB = 1.0;

// Keeps the estimate with probability luminance(weight), clamped, and
// rescales the survivor
bool russian_roulette(Color3 &weight, Sampler &sampler) {
  const double lum = std::max(luminance(weight), 0.0);
  if (lum == 0.0)
    return false;
  const double prob = std::clamp(lum, RR_MIN_PROB, RR_MAX_PROB);
  if (sampler.next() > prob)
    return false;
  weight = weight / prob;
  return true;
}

// Radiance arriving along `ray` from whatever it hits first, no further bounces
Color3 first_hit_radiance(const Ray &ray, const Scene &scene, const IntegratorConfig &config, RenderStats &stats) {
  const auto hit = nearest_surface(ray, scene, config, stats);
  if (!hit)
    return scene.background(ray.d);
  if (surface_hit_has_emission(*hit))
    return surface_hit_emission(*hit, -ray.d);
  return {0.0, 0.0, 0.0};
}

} // namespace

DirectStrategy parse_direct_strategy(std::string_view name) {
  if (name == "bsdf")
    return DirectStrategy::Bsdf;
  if (name == "naive")
    return DirectStrategy::Naive;
  if (name == "emitter")
    return DirectStrategy::Emitter;
  if (name == "mis")
    return DirectStrategy::Mis;

  RLOG_ERROR("Unknown direct lighting strategy: {}", name);
  throw std::invalid_argument("Unknown direct lighting strategy: " + std::string(name));
}

double balance_heuristic(double pdf_a, double pdf_b) {
  const double denom = pdf_a + pdf_b;
  if (!(denom > 0.0))
    return 0.0;
  return pdf_a / denom;
}

Color3 direct_emitter_mis(const SurfaceContext &surface, const Scene &scene, Sampler &sampler, const Frame &frame,
                          const Vec3 &wo, const IntegratorConfig &config, RenderStats &stats) {
  const Color3 zero{0.0, 0.0, 0.0};
  if (!scene.has_analytic_emitters())
    return zero;
  if (surface.material().have_delta())
    return zero;

  const auto [es, shape] = scene.root.sample_direct(surface.position, sampler.next2d());
  if (!shape || es.pdf <= 0.0)
    return zero;

  const Vec3 origin = surface.spawn_origin(config.sdf_settings);
  const Vec3 to_light = es.y - origin;
  const double dist = norm(to_light);
  if (dist <= 2.0 * RAY_EPS)
    return zero;
  const Vec3 dir_world = to_light / dist;

  const Ray shadow_ray = Ray(origin, dir_world).with_distance_max(dist - 2.0 * RAY_EPS);
  if (nearest_surface(shadow_ray, scene, config, stats))
    return zero;

  const Vec3 wi = frame.to_local(dir_world);
  const Color3 fbsdf_cos = surface.material().evaluate(wo, wi);

  const Frame light_frame(es.n);
  const Color3 le = shape->material().emission(light_frame.to_local(-dir_world));

  const double pdf_bsdf = surface.material().pdf(wo, wi);
  const double mis_w = balance_heuristic(es.pdf, pdf_bsdf);
  return fbsdf_cos / es.pdf * le * mis_w;
}

PathMisIntegrator::PathMisIntegrator(const IntegratorConfig &config) : config_(config) {}

Color3 PathMisIntegrator::li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const {
  Color3 acc{0.0, 0.0, 0.0};
  Color3 throughput{1.0, 1.0, 1.0};
  Ray r = ray;
  std::optional<SurfaceHit> current_hit = nearest_surface(r, scene, config_, stats);
  bool skip_next_emission = false;

  for (std::size_t depth = 0; depth < config_.max_depth; ++depth) {
    if (!current_hit) {
      acc += throughput * scene.background(r.d);
      break;
    }

    const SurfaceContext surface = SurfaceContext::from_hit(*current_hit);
    const Frame frame(surface.normal);
    const Vec3 wo = frame.to_local(-r.d);
    const Material &material = surface.material();

    // Emission already accounted for by the previous vertex's MIS estimate
    if (!skip_next_emission)
      acc += throughput * material.emission(wo);
    skip_next_emission = false;

    Color3 direct = direct_emitter_mis(surface, scene, sampler, frame, wo, config_, stats);

    const auto sampled = material.sample(wo, sampler.next2d());
    if (!sampled) {
      acc += throughput * direct;
      break;
    }

    const Vec3 wi_world = frame.to_world(sampled->wi);
    const Ray next_ray(surface.spawn_origin(config_.sdf_settings), wi_world);
    std::optional<SurfaceHit> next_hit = nearest_surface(next_ray, scene, config_, stats);

    if (next_hit && surface_hit_has_emission(*next_hit)) {
      const Color3 le = surface_hit_emission(*next_hit, -next_ray.d);

      double mis_w = 1.0;
      if (!material.have_delta()) {
        const double pdf_bsdf = material.pdf(wo, sampled->wi);
        // No closed-form solid-angle density for implicit emitters
        double pdf_light = 0.0;
        if (const auto *its = std::get_if<Intersection>(&*next_hit))
          pdf_light = scene.root.pdf_direct(*its->shape, surface.position, its->p, its->n);
        mis_w = balance_heuristic(pdf_bsdf, pdf_light);
      }

      direct += sampled->weight * le * mis_w;
      skip_next_emission = true;
    }

    acc += throughput * direct;
    throughput *= sampled->weight;
    r = next_ray;
    current_hit = std::move(next_hit);
  }

  return acc;
}

DirectIntegrator::DirectIntegrator(const IntegratorConfig &config) : config_(config) {}

Color3 DirectIntegrator::li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const {
  const bool include_sdf = config_.mode == GeometryMode::Hybrid;
  SurfaceSelection selection = collect_surface_hits(ray, scene, config_.sdf_settings, stats, include_sdf);
  if (selection.is_empty())
    return scene.background(ray.d);

  const SurfaceContext surface = SurfaceContext::from_hit(*std::move(selection).into_nearest());
  const Frame frame(surface.normal);
  const Vec3 wo = frame.to_local(-ray.d);

  if (surface.material().have_emission())
    return surface.material().emission(wo);

  switch (config_.strategy) {
  case DirectStrategy::Bsdf:
    return sample_bsdf(surface, scene, sampler, frame, wo, stats);
  case DirectStrategy::Naive:
    return hemisphere_naive(surface, scene, sampler, frame, wo, stats);
  case DirectStrategy::Emitter:
    if (surface.material().have_delta())
      return sample_bsdf(surface, scene, sampler, frame, wo, stats);
    return explicit_emitter(surface, scene, sampler, frame, wo, stats);
  case DirectStrategy::Mis:
    break;
  }

  // BSDF half of the MIS pair; emitters without a light density keep the full weight
  Color3 bsdf_term{0.0, 0.0, 0.0};
  if (const auto sampled = surface.material().sample(wo, sampler.next2d())) {
    const Ray next_ray(surface.spawn_origin(config_.sdf_settings), frame.to_world(sampled->wi));
    const auto next_hit = nearest_surface(next_ray, scene, config_, stats);
    if (!next_hit) {
      bsdf_term = sampled->weight * scene.background(next_ray.d);
    } else if (surface_hit_has_emission(*next_hit)) {
      double mis_w = 1.0;
      if (!surface.material().have_delta()) {
        double pdf_light = 0.0;
        if (const auto *its = std::get_if<Intersection>(&*next_hit))
          pdf_light = scene.root.pdf_direct(*its->shape, surface.position, its->p, its->n);
        mis_w = balance_heuristic(surface.material().pdf(wo, sampled->wi), pdf_light);
      }
      bsdf_term = sampled->weight * surface_hit_emission(*next_hit, -next_ray.d) * mis_w;
    }
  }

  return bsdf_term + direct_emitter_mis(surface, scene, sampler, frame, wo, config_, stats);
}

Color3 DirectIntegrator::sample_bsdf(const SurfaceContext &surface, const Scene &scene, Sampler &sampler,
                                     const Frame &frame, const Vec3 &wo, RenderStats &stats) const {
  const auto sampled = surface.material().sample(wo, sampler.next2d());
  if (!sampled)
    return {0.0, 0.0, 0.0};

  Color3 weight = sampled->weight;
  if (!russian_roulette(weight, sampler))
    return {0.0, 0.0, 0.0};

  const Ray next_ray(surface.spawn_origin(config_.sdf_settings), frame.to_world(sampled->wi));
  return weight * first_hit_radiance(next_ray, scene, config_, stats);
}

Color3 DirectIntegrator::hemisphere_naive(const SurfaceContext &surface, const Scene &scene, Sampler &sampler,
                                          const Frame &frame, const Vec3 &wo, RenderStats &stats) const {
  if (surface.material().have_delta())
    return sample_bsdf(surface, scene, sampler, frame, wo, stats);

  const Vec3 wi = sample::sample_uniform_hemisphere(sampler.next2d());
  const double pdf = sample::pdf_uniform_hemisphere(wi);
  if (pdf <= 0.0)
    return {0.0, 0.0, 0.0};

  Color3 weight = surface.material().evaluate(wo, wi) / pdf;
  if (!russian_roulette(weight, sampler))
    return {0.0, 0.0, 0.0};

  const Ray next_ray(surface.spawn_origin(config_.sdf_settings), frame.to_world(wi));
  return weight * first_hit_radiance(next_ray, scene, config_, stats);
}

Color3 DirectIntegrator::explicit_emitter(const SurfaceContext &surface, const Scene &scene, Sampler &sampler,
                                          const Frame &frame, const Vec3 &wo, RenderStats &stats) const {
  const Color3 zero{0.0, 0.0, 0.0};
  if (!scene.has_analytic_emitters())
    return zero;

  const auto [es, shape] = scene.root.sample_direct(surface.position, sampler.next2d());
  if (!shape || es.pdf <= 0.0)
    return zero;

  const Vec3 origin = surface.spawn_origin(config_.sdf_settings);
  const Vec3 to_light = es.y - origin;
  const double dist = norm(to_light);
  if (dist <= 2.0 * RAY_EPS)
    return zero;
  const Vec3 dir_world = to_light / dist;

  const Ray shadow_ray = Ray(origin, dir_world).with_distance_max(dist - 2.0 * RAY_EPS);
  if (nearest_surface(shadow_ray, scene, config_, stats))
    return zero;

  Color3 weight = surface.material().evaluate(wo, frame.to_local(dir_world)) / es.pdf;
  if (!russian_roulette(weight, sampler))
    return zero;

  const Frame light_frame(es.n);
  return weight * shape->material().emission(light_frame.to_local(-dir_world));
}

PathIntegrator::PathIntegrator(const IntegratorConfig &config) : config_(config) {}

Color3 PathIntegrator::li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const {
  Color3 throughput{1.0, 1.0, 1.0};
  Ray r = ray;

  for (std::size_t depth = 0; depth < config_.max_depth; ++depth) {
    const auto hit = nearest_surface(r, scene, config_, stats);
    if (!hit)
      return throughput * scene.background(r.d);

    const SurfaceContext surface = SurfaceContext::from_hit(*hit);
    const Frame frame(surface.normal);
    const Vec3 wo = frame.to_local(-r.d);

    const auto sampled = surface.material().sample(wo, sampler.next2d());
    if (!sampled)
      return throughput * surface.material().emission(wo);

    throughput *= sampled->weight;
    r = Ray(surface.spawn_origin(config_.sdf_settings), frame.to_world(sampled->wi));
  }

  return {0.0, 0.0, 0.0};
}

NormalIntegrator::NormalIntegrator(const IntegratorConfig &config) : config_(config) {}

Color3 NormalIntegrator::li(const Ray &ray, const Scene &scene, Sampler &, RenderStats &stats) const {
  const auto hit = nearest_surface(ray, scene, config_, stats);
  if (!hit)
    return {0.0, 0.0, 0.0};
  const SurfaceContext surface = SurfaceContext::from_hit(*hit);
  return (surface.normal + Vec3{1.0, 1.0, 1.0}) * 0.5;
}

std::unique_ptr<Integrator> make_integrator(std::string_view type, IntegratorConfig config) {
  if (type == "path_mis") {
    config.mode = GeometryMode::Analytic;
    return std::make_unique<PathMisIntegrator>(config);
  }
  if (type == "sdf_path_mis" || type == "hybrid_path_mis") {
    config.mode = GeometryMode::Hybrid;
    return std::make_unique<PathMisIntegrator>(config);
  }
  if (type == "direct" || type == "sdf_direct" || type == "hybrid_direct") {
    config.mode = type == "direct" ? GeometryMode::Analytic : GeometryMode::Hybrid;
    return std::make_unique<DirectIntegrator>(config);
  }
  if (type == "path" || type == "hybrid_path") {
    config.mode = type == "path" ? GeometryMode::Analytic : GeometryMode::Hybrid;
    return std::make_unique<PathIntegrator>(config);
  }
  if (type == "normal")
    return std::make_unique<NormalIntegrator>(config);

  RLOG_ERROR("Unknown integrator type: {}", type);
  throw std::invalid_argument("Unknown integrator type: " + std::string(type));
}

} // namespace radiant::core
