#pragma once
#include <optional>
#include <radiant/math/vec.hpp>

using namespace radiant::math;

namespace radiant::core {

/// @brief Result of sampling a scattering direction
struct SampledDirection {
  Color3 weight; ///< f cos(theta) / pdf, or the tint of a delta lobe
  Vec3 wi;       ///< Sampled direction in the local shading frame
};

/// @brief Surface scattering and emission, expressed in the local shading
/// frame (normal along +z, `wo` points away from the surface)
class Material {
public:
  virtual ~Material() = default;

  /// @brief Importance sample an incident direction
  /// @param wo Outgoing direction (local frame)
  /// @param sample Uniform sample in [0, 1)^2
  /// @return Sampled direction, or nothing when the material does not scatter
  virtual std::optional<SampledDirection> sample(const Vec3 &wo, const Vec2 &sample) const = 0;

  /// @brief BSDF times cosine, f(wo, wi) cos(theta_i); zero for delta lobes
  virtual Color3 evaluate(const Vec3 &wo, const Vec3 &wi) const = 0;

  /// @brief Solid-angle density of sampling wi given wo; zero for delta lobes
  virtual double pdf(const Vec3 &wo, const Vec3 &wi) const = 0;

  virtual bool have_delta() const = 0;

  virtual Color3 emission(const Vec3 &wo) const;
  virtual bool have_emission() const;
};

/// Lambertian reflector
class Diffuse : public Material {
public:
  explicit Diffuse(const Color3 &albedo);

  std::optional<SampledDirection> sample(const Vec3 &wo, const Vec2 &sample) const override;
  Color3 evaluate(const Vec3 &wo, const Vec3 &wi) const override;
  double pdf(const Vec3 &wo, const Vec3 &wi) const override;
  bool have_delta() const override { return false; }

  const Color3 &albedo() const { return albedo_; }

private:
  Color3 albedo_;
};

/// One-sided area light with constant radiance; does not scatter
class DiffuseEmitter : public Material {
public:
  explicit DiffuseEmitter(const Color3 &radiance);

  std::optional<SampledDirection> sample(const Vec3 &wo, const Vec2 &sample) const override;
  Color3 evaluate(const Vec3 &wo, const Vec3 &wi) const override;
  double pdf(const Vec3 &wo, const Vec3 &wi) const override;
  bool have_delta() const override { return false; }

  Color3 emission(const Vec3 &wo) const override;
  bool have_emission() const override { return true; }

private:
  Color3 radiance_;
};

/// Perfect specular reflector
class Mirror : public Material {
public:
  explicit Mirror(const Color3 &reflectance);

  std::optional<SampledDirection> sample(const Vec3 &wo, const Vec2 &sample) const override;
  Color3 evaluate(const Vec3 &wo, const Vec3 &wi) const override;
  double pdf(const Vec3 &wo, const Vec3 &wi) const override;
  bool have_delta() const override { return true; }

private:
  Color3 reflectance_;
};

} // namespace radiant::core
