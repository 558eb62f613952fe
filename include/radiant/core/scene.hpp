#pragma once
#include <memory>
#include <optional>
#include <radiant/core/camera.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/shape.hpp>
#include <radiant/math/vec.hpp>
#include <vector>

using namespace radiant::math;

namespace radiant::core {

/// @brief Geometry, emitters and camera of one render; read-only while rendering
struct Scene {
  ShapeGroup root;                                      ///< Analytic shapes
  std::vector<std::shared_ptr<const SdfObject>> sdf_objects; ///< Implicit surfaces
  Color3 background_color{0.0, 0.0, 0.0};              ///< Radiance of escaping rays
  std::optional<PerspectiveCamera> camera;

  void add_sdf_object(std::shared_ptr<const SdfObject> object);

  Color3 background(const Vec3 &) const { return background_color; }

  /// @brief True when the analytic root holds at least one emitter
  bool has_analytic_emitters() const { return root.emitter_count() > 0; }

  /// @brief Camera of the scene; throws when none was set
  const PerspectiveCamera &require_camera() const;
};

} // namespace radiant::core
