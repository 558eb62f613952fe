#pragma once
#include <cstddef>
#include <memory>
#include <radiant/core/ray.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/stats.hpp>
#include <radiant/core/surface.hpp>
#include <radiant/math/vec.hpp>
#include <radiant/sample/sampler.hpp>
#include <string_view>

using namespace radiant::math;

namespace radiant::core {

using sample::Sampler;

/// @brief Which geometry the nearest-surface query considers
enum class GeometryMode {
  Analytic, ///< Shapes of the scene root only
  Hybrid,   ///< Shapes and SDF objects, nearest wins
};

/// @brief Estimator used by DirectIntegrator
enum class DirectStrategy {
  Bsdf,    ///< Follow one BSDF sample
  Naive,   ///< Uniform hemisphere direction
  Emitter, ///< Area sampling of analytic emitters
  Mis,     ///< BSDF and emitter samples combined with the balance heuristic
};

/// @brief Parse "bsdf", "naive", "emitter" or "mis"
/// @throws std::invalid_argument for other names
DirectStrategy parse_direct_strategy(std::string_view name);

struct IntegratorConfig {
  std::size_t max_depth{16};
  GeometryMode mode{GeometryMode::Hybrid};
  RaymarchSettings sdf_settings{};
  DirectStrategy strategy{DirectStrategy::Bsdf}; ///< Only read by DirectIntegrator

  IntegratorConfig() = default;
  IntegratorConfig(std::size_t max_depth, GeometryMode mode, const RaymarchSettings &sdf_settings = {})
      : max_depth(max_depth), mode(mode), sdf_settings(sdf_settings) {}
};

/// @brief Radiance estimator for one camera ray
class Integrator {
public:
  virtual ~Integrator() = default;

  /// @brief Estimate of the radiance arriving along `ray`
  virtual Color3 li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const = 0;
};

/// @brief MIS weight of strategy a against strategy b, 0 when both densities vanish
double balance_heuristic(double pdf_a, double pdf_b);

/// @brief Light-sampled direct illumination at a surface, weighted against BSDF sampling
/// @param frame Shading frame around surface.normal
/// @param wo Outgoing direction in the shading frame
Color3 direct_emitter_mis(const SurfaceContext &surface, const Scene &scene, Sampler &sampler, const Frame &frame,
                          const Vec3 &wo, const IntegratorConfig &config, RenderStats &stats);

/// @brief Unidirectional path tracer with next-event estimation and MIS
class PathMisIntegrator : public Integrator {
public:
  explicit PathMisIntegrator(const IntegratorConfig &config);

  Color3 li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const override;

  const IntegratorConfig &config() const { return config_; }

private:
  IntegratorConfig config_;
};

/// @brief Single-bounce direct lighting
///
/// Surfaces seen by the camera return their own emission. Otherwise one
/// estimate of the light reflected from the first hit is taken with the
/// configured strategy. Delta materials always follow their BSDF sample.
/// Every estimate except the MIS one goes through Russian roulette on its
/// luminance.
class DirectIntegrator : public Integrator {
public:
  explicit DirectIntegrator(const IntegratorConfig &config);

  Color3 li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const override;

  const IntegratorConfig &config() const { return config_; }

private:
  Color3 sample_bsdf(const SurfaceContext &surface, const Scene &scene, Sampler &sampler, const Frame &frame,
                     const Vec3 &wo, RenderStats &stats) const;
  Color3 hemisphere_naive(const SurfaceContext &surface, const Scene &scene, Sampler &sampler, const Frame &frame,
                          const Vec3 &wo, RenderStats &stats) const;
  Color3 explicit_emitter(const SurfaceContext &surface, const Scene &scene, Sampler &sampler, const Frame &frame,
                          const Vec3 &wo, RenderStats &stats) const;

  IntegratorConfig config_;
};

/// @brief Path tracer driven by BSDF sampling only
///
/// Emission is gathered only where a path ends on a surface that does not
/// scatter, or escapes to the background.
class PathIntegrator : public Integrator {
public:
  explicit PathIntegrator(const IntegratorConfig &config);

  Color3 li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const override;

  const IntegratorConfig &config() const { return config_; }

private:
  IntegratorConfig config_;
};

/// @brief Shading normal of the nearest surface mapped to [0, 1]^3
class NormalIntegrator : public Integrator {
public:
  explicit NormalIntegrator(const IntegratorConfig &config);

  Color3 li(const Ray &ray, const Scene &scene, Sampler &sampler, RenderStats &stats) const override;

private:
  IntegratorConfig config_;
};

/// @brief Build an integrator by name
///
/// "path_mis", "direct" and "path" see analytic geometry only.
/// "sdf_path_mis", "hybrid_path_mis", "sdf_direct", "hybrid_direct" and
/// "hybrid_path" also march the SDF objects. "normal" keeps `config.mode`.
/// @throws std::invalid_argument for unknown names
std::unique_ptr<Integrator> make_integrator(std::string_view type, IntegratorConfig config = {});

} // namespace radiant::core
