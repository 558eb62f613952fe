#include <radiant/core/camera.hpp>
#include <radiant/core/integrator.hpp>
#include <radiant/core/material.hpp>
#include <radiant/core/render.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/sdf.hpp>
#include <radiant/core/shape.hpp>
#include <radiant/log/logger.hpp>
#include <radiant/math/transform.hpp>
#include <radiant/sample/sampler.hpp>

#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace radiant::core;
using namespace radiant::sample;
using namespace radiant::log;

PYBIND11_MODULE(_core, m) {
  m.doc() = "Python bindings for the radiant path tracing core";

  // Math bindings
  py::class_<Vec3>(m, "Vec3")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("x"), py::arg("y"), py::arg("z"))
      .def_readwrite("x", &Vec3::x)
      .def_readwrite("y", &Vec3::y)
      .def_readwrite("z", &Vec3::z)
      .def("__repr__", [](const Vec3 &v) {
        return "Vec3(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
      });

  py::class_<Vec2>(m, "Vec2")
      .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
      .def_readwrite("x", &Vec2::x)
      .def_readwrite("y", &Vec2::y);

  py::class_<Transform>(m, "Transform")
      .def(py::init<>())
      .def_static("translate", &Transform::translate, py::arg("t"))
      .def_static("scale", &Transform::scale, py::arg("s"))
      .def_static("rotate", &Transform::rotate, py::arg("axis"), py::arg("degrees"),
                  "Rotation of `degrees` around `axis`")
      .def_static("look_at", &Transform::look_at, py::arg("origin"), py::arg("target"), py::arg("up"),
                  "Camera-to-world transform looking from origin at target")
      .def(py::self * py::self)
      .def("point", &Transform::point, py::arg("p"))
      .def("vector", &Transform::vector, py::arg("v"))
      .def("inverse", &Transform::inverse);

  // Material bindings
  py::class_<Material, std::shared_ptr<Material>>(m, "Material")
      .def("have_delta", &Material::have_delta)
      .def("have_emission", &Material::have_emission);

  py::class_<Diffuse, Material, std::shared_ptr<Diffuse>>(m, "Diffuse")
      .def(py::init<const Color3 &>(), py::arg("albedo"));

  py::class_<DiffuseEmitter, Material, std::shared_ptr<DiffuseEmitter>>(m, "DiffuseEmitter")
      .def(py::init<const Color3 &>(), py::arg("radiance"));

  py::class_<Mirror, Material, std::shared_ptr<Mirror>>(m, "Mirror")
      .def(py::init<const Color3 &>(), py::arg("reflectance"));

  // SDF bindings
  py::class_<RaymarchSettings>(m, "RaymarchSettings")
      .def(py::init<>())
      .def_readwrite("max_steps", &RaymarchSettings::max_steps)
      .def_readwrite("hit_epsilon", &RaymarchSettings::hit_epsilon)
      .def_readwrite("normal_epsilon", &RaymarchSettings::normal_epsilon)
      .def_readwrite("step_clamp", &RaymarchSettings::step_clamp)
      .def_readwrite("max_travel_distance", &RaymarchSettings::max_travel_distance)
      .def_readwrite("surface_bias", &RaymarchSettings::surface_bias);

  py::class_<SdfObject, std::shared_ptr<SdfObject>>(m, "SdfObject")
      .def("signed_distance", &SdfObject::signed_distance, py::arg("p"),
           "Signed distance at a world-space point");

  py::class_<SdfSphere, SdfObject, std::shared_ptr<SdfSphere>>(m, "SdfSphere")
      .def(py::init([](const Transform &to_world, double radius, std::shared_ptr<Material> material,
                       std::optional<RaymarchSettings> settings) {
             return std::make_shared<SdfSphere>(to_world, radius, std::move(material), settings);
           }),
           py::arg("to_world"), py::arg("radius"), py::arg("material") = nullptr, py::arg("settings") = py::none());

  // Scene bindings
  py::class_<PerspectiveCamera>(m, "PerspectiveCamera")
      .def(py::init<const Transform &, std::size_t, std::size_t, double, double>(), py::arg("to_world"),
           py::arg("width"), py::arg("height"), py::arg("vfov") = 60.0, py::arg("fdist") = 1.0)
      .def_property_readonly("width", &PerspectiveCamera::width)
      .def_property_readonly("height", &PerspectiveCamera::height);

  py::class_<Scene>(m, "Scene")
      .def(py::init<>())
      .def_readwrite("background", &Scene::background_color)
      .def_readwrite("camera", &Scene::camera)
      .def(
          "add_quad",
          [](Scene &scene, const Transform &to_world, const Vec2 &size, std::shared_ptr<Material> material) {
            scene.root.add_shape(std::make_unique<Quad>(to_world, size, std::move(material)));
          },
          py::arg("to_world"), py::arg("size"), py::arg("material"),
          "Add a size.x by size.y rectangle in the local z = 0 plane")
      .def(
          "add_sdf",
          [](Scene &scene, std::shared_ptr<SdfObject> object) { scene.add_sdf_object(std::move(object)); },
          py::arg("object"))
      .def_property_readonly("shape_count", [](const Scene &scene) { return scene.root.size(); })
      .def_property_readonly("emitter_count", [](const Scene &scene) { return scene.root.emitter_count(); });

  // Render bindings
  py::enum_<GeometryMode>(m, "GeometryMode")
      .value("analytic", GeometryMode::Analytic)
      .value("hybrid", GeometryMode::Hybrid);

  py::enum_<DirectStrategy>(m, "DirectStrategy")
      .value("bsdf", DirectStrategy::Bsdf)
      .value("naive", DirectStrategy::Naive)
      .value("emitter", DirectStrategy::Emitter)
      .value("mis", DirectStrategy::Mis);

  m.def("parse_direct_strategy", &parse_direct_strategy, py::arg("name"));

  py::class_<IntegratorConfig>(m, "IntegratorConfig")
      .def(py::init<>())
      .def(py::init<std::size_t, GeometryMode, const RaymarchSettings &>(), py::arg("max_depth"),
           py::arg("mode"), py::arg("sdf_settings") = RaymarchSettings{})
      .def_readwrite("max_depth", &IntegratorConfig::max_depth)
      .def_readwrite("mode", &IntegratorConfig::mode)
      .def_readwrite("sdf_settings", &IntegratorConfig::sdf_settings)
      .def_readwrite("strategy", &IntegratorConfig::strategy);

  py::class_<Integrator>(m, "Integrator");

  m.def(
      "make_integrator", [](const std::string &type, const IntegratorConfig &config) {
        return make_integrator(type, config);
      },
      py::arg("type"), py::arg("config") = IntegratorConfig{},
      "Create an integrator: 'path_mis', 'sdf_path_mis', 'hybrid_path_mis', 'direct', 'sdf_direct', "
      "'hybrid_direct', 'path', 'hybrid_path' or 'normal'");

  py::class_<IndependentSampler>(m, "IndependentSampler")
      .def(py::init<std::uint64_t, std::size_t>(), py::arg("seed"), py::arg("spp"))
      .def_property_readonly("seed", &IndependentSampler::seed)
      .def_property("spp", &IndependentSampler::sample_count, &IndependentSampler::set_sample_count);

  py::class_<RenderConfig>(m, "RenderConfig")
      .def(py::init<>())
      .def(py::init<std::size_t, bool>(), py::arg("n_threads"), py::arg("ignore_nans") = false)
      .def_readwrite("n_threads", &RenderConfig::n_threads)
      .def_readwrite("ignore_nans", &RenderConfig::ignore_nans);

  py::class_<RenderStats>(m, "RenderStats")
      .def_readonly("intersections", &RenderStats::intersections)
      .def_readonly("traced_rays", &RenderStats::traced_rays)
      .def_readonly("raymarch_steps", &RenderStats::raymarch_steps)
      .def_readonly("raymarch_hits", &RenderStats::raymarch_hits)
      .def_readonly("raymarch_misses", &RenderStats::raymarch_misses)
      .def_readonly("raymarch_escaped", &RenderStats::raymarch_escaped)
      .def_readonly("raymarch_exhausted", &RenderStats::raymarch_exhausted)
      .def_readonly("rejected_samples", &RenderStats::rejected_samples)
      .def("intersections_per_ray", &RenderStats::intersections_per_ray);

  m.def(
      "render",
      [](const Integrator &integrator, const Scene &scene, const IndependentSampler &sampler,
         const RenderConfig &config) {
        RenderResult result = [&]() {
          py::gil_scoped_release release;
          return render(integrator, scene, sampler, config);
        }();

        const auto h = static_cast<py::ssize_t>(result.image.height);
        const auto w = static_cast<py::ssize_t>(result.image.width);
        py::array_t<double> pixels({h, w, static_cast<py::ssize_t>(3)});
        auto view = pixels.mutable_unchecked<3>();
        for (py::ssize_t y = 0; y < h; ++y) {
          for (py::ssize_t x = 0; x < w; ++x) {
            const Color3 &c = result.image.data[static_cast<std::size_t>(y * w + x)];
            view(y, x, 0) = c.x;
            view(y, x, 1) = c.y;
            view(y, x, 2) = c.z;
          }
        }
        return py::make_tuple(pixels, result.stats);
      },
      py::arg("integrator"), py::arg("scene"), py::arg("sampler"), py::arg("config") = RenderConfig{},
      "Render the scene and return (pixels[height, width, 3], stats)");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the radiant module");
}
