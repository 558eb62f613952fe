#include <radiant/core/material.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/math/utils.hpp>
#include <radiant/sample/warp.hpp>
#include <stdexcept>
#include <string>

namespace radiant::core {

using sample::pdf_cosine_hemisphere;
using sample::sample_cosine_hemisphere;

namespace {

void require_color(const Color3 &c, const char *what) {
  if (!is_valid_color(c)) {
    RLOG_ERROR("{}: colour ({}, {}, {}) must be finite and non-negative", what, c.x, c.y, c.z);
    throw std::invalid_argument(std::string(what) + ": invalid colour");
  }
}

} // namespace

Color3 Material::emission(const Vec3 &) const {
  return {0, 0, 0};
}

bool Material::have_emission() const {
  return false;
}

Diffuse::Diffuse(const Color3 &albedo) : albedo_(albedo) {
  require_color(albedo, "Diffuse");
}

std::optional<SampledDirection> Diffuse::sample(const Vec3 &wo, const Vec2 &sample) const {
  if (wo.z <= 0.0)
    return std::nullopt;

  const Vec3 wi = sample_cosine_hemisphere(sample);
  if (wi.z <= 0.0)
    return std::nullopt;

  // (albedo / pi) cos / (cos / pi)
  return SampledDirection{albedo_, wi};
}

Color3 Diffuse::evaluate(const Vec3 &wo, const Vec3 &wi) const {
  if (wo.z <= 0.0 || wi.z <= 0.0)
    return {0, 0, 0};
  return albedo_ * (INV_PI * wi.z);
}

double Diffuse::pdf(const Vec3 &wo, const Vec3 &wi) const {
  if (wo.z <= 0.0)
    return 0.0;
  return pdf_cosine_hemisphere(wi);
}

DiffuseEmitter::DiffuseEmitter(const Color3 &radiance) : radiance_(radiance) {
  require_color(radiance, "DiffuseEmitter");
}

std::optional<SampledDirection> DiffuseEmitter::sample(const Vec3 &, const Vec2 &) const {
  return std::nullopt;
}

Color3 DiffuseEmitter::evaluate(const Vec3 &, const Vec3 &) const {
  return {0, 0, 0};
}

double DiffuseEmitter::pdf(const Vec3 &, const Vec3 &) const {
  return 0.0;
}

Color3 DiffuseEmitter::emission(const Vec3 &wo) const {
  if (wo.z > 0.0)
    return radiance_;
  return {0, 0, 0};
}

Mirror::Mirror(const Color3 &reflectance) : reflectance_(reflectance) {
  require_color(reflectance, "Mirror");
}

std::optional<SampledDirection> Mirror::sample(const Vec3 &wo, const Vec2 &) const {
  if (wo.z <= 0.0)
    return std::nullopt;
  return SampledDirection{reflectance_, Vec3{-wo.x, -wo.y, wo.z}};
}

Color3 Mirror::evaluate(const Vec3 &, const Vec3 &) const {
  return {0, 0, 0};
}

double Mirror::pdf(const Vec3 &, const Vec3 &) const {
  return 0.0;
}

} // namespace radiant::core
