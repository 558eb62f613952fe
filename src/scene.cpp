#include <radiant/core/scene.hpp>
#include <radiant/log/logger.hpp>
#include <stdexcept>

namespace radiant::core {

void Scene::add_sdf_object(std::shared_ptr<const SdfObject> object) {
  if (!object) {
    RLOG_ERROR("Scene::add_sdf_object: null object");
    throw std::invalid_argument("Scene::add_sdf_object: null object");
  }
  const AABB bounds = object->world_bounds();
  if (!bounds.is_valid()) {
    RLOG_ERROR("Scene::add_sdf_object: empty or inverted bounds");
    throw std::invalid_argument("Scene::add_sdf_object: empty or inverted bounds");
  }
  sdf_objects.push_back(std::move(object));
}

const PerspectiveCamera &Scene::require_camera() const {
  if (!camera) {
    RLOG_ERROR("Scene: no camera defined");
    throw std::invalid_argument("Scene: no camera defined");
  }
  return *camera;
}

} // namespace radiant::core
