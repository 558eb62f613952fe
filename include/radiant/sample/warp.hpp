#pragma once
#include <radiant/math/vec.hpp>

using namespace radiant::math;

namespace radiant::sample {

/// @brief Cosine-weighted direction on the +z hemisphere
/// @param u Uniform sample in [0, 1)^2
Vec3 sample_cosine_hemisphere(const Vec2 &u);

/// @brief Solid-angle density of sample_cosine_hemisphere (0 for z <= 0)
double pdf_cosine_hemisphere(const Vec3 &dir);

/// @brief Uniform direction on the +z hemisphere
Vec3 sample_uniform_hemisphere(const Vec2 &u);

/// @brief Solid-angle density of sample_uniform_hemisphere (0 for z <= 0)
double pdf_uniform_hemisphere(const Vec3 &dir);

} // namespace radiant::sample
