#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <radiant/core/integrator.hpp>
#include <radiant/core/material.hpp>
#include <radiant/core/render.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/shape.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/sample/sampler.hpp>
#include <string>

using namespace radiant::core;
using namespace radiant::sample;

// Floor quad lit by an overhead emitter quad, with a mirror SDF sphere resting on the floor
static Scene build_demo_scene(std::size_t width, std::size_t height) {
  Scene scene;
  scene.background_color = {0.02, 0.02, 0.03};

  auto floor = std::make_shared<Diffuse>(Color3{0.75, 0.75, 0.7});
  auto light = std::make_shared<DiffuseEmitter>(Color3{12.0, 11.0, 9.0});
  auto chrome = std::make_shared<Mirror>(Color3{0.9, 0.9, 0.9});

  // Local +z of the floor points up
  scene.root.add_shape(std::make_unique<Quad>(Transform::rotate(X_UNIT_VEC3, -90.0), Vec2(8.0, 8.0), floor));
  // Emitter at y = 3 facing down
  scene.root.add_shape(std::make_unique<Quad>(
      Transform::translate({0.0, 3.0, 0.0}) * Transform::rotate(X_UNIT_VEC3, 90.0), Vec2(1.5, 1.5), light));

  scene.add_sdf_object(std::make_shared<SdfSphere>(Transform::translate({0.0, 0.8, 0.0}), 0.8, chrome));

  scene.camera.emplace(Transform::look_at({0.0, 2.0, 5.0}, {0.0, 0.7, 0.0}, Y_UNIT_VEC3), width, height, 45.0);
  return scene;
}

// Usage: render_demo [output.pfm] [spp] [integrator] [log level]
int main(int argc, char **argv) {
  const std::string output = argc > 1 ? argv[1] : "render_demo.pfm";
  const std::size_t spp = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 64;
  const std::string type = argc > 3 ? argv[3] : "hybrid_path_mis";

  if (argc > 4 && !radiant::log::Logger::instance().set_level(argv[4]))
    RLOG_WARN("Unknown log level '{}', keeping the current one", argv[4]);

  try {
    const Scene scene = build_demo_scene(320, 240);
    const auto integrator = make_integrator(type);
    const IndependentSampler sampler(42, spp);

    const RenderResult result = render(*integrator, scene, sampler, RenderConfig{0, true});
    result.image.save_pfm(output);
    RLOG_INFO("Wrote {}", output);
  } catch (const std::exception &e) {
    RLOG_ERROR("render_demo failed: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
