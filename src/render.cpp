#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <radiant/core/render.hpp>
#include <radiant/log/logger.hpp>
#include <thread>

namespace radiant::core {

std::vector<Tile> make_tiles(std::size_t width, std::size_t height) {
  std::vector<Tile> tiles;
  for (std::size_t x = 0; x < width; x += TILE_SIZE) {
    for (std::size_t y = 0; y < height; y += TILE_SIZE) {
      tiles.push_back(Tile{tiles.size(), x, y, std::min(TILE_SIZE, width - x), std::min(TILE_SIZE, height - y)});
    }
  }
  return tiles;
}

TileResult render_tile(const Integrator &integrator, const Scene &scene, Sampler &sampler, const Tile &tile,
                       const RenderConfig &config) {
  const PerspectiveCamera &camera = scene.require_camera();
  const std::size_t spp = sampler.sample_count();

  TileResult result{Image(tile.width, tile.height), RenderStats{}};

  for (std::size_t ly = 0; ly < tile.height; ++ly) {
    for (std::size_t lx = 0; lx < tile.width; ++lx) {
      const double x = static_cast<double>(tile.x0 + lx);
      const double y = static_cast<double>(tile.y0 + ly);

      Color3 sum{0.0, 0.0, 0.0};
      std::size_t accepted = 0;
      for (std::size_t s = 0; s < spp; ++s) {
        const Vec2 jitter = sampler.next2d();
        const Ray ray = camera.generate_ray({x + jitter.x, y + jitter.y});
        const Color3 value = integrator.li(ray, scene, sampler, result.stats);

        if (config.ignore_nans && !is_finite(value)) {
          result.stats.rejected_samples += 1;
          continue;
        }
        sum += value;
        accepted += 1;
      }

      const std::size_t count = config.ignore_nans ? accepted : spp;
      result.image.data[ly * tile.width + lx] = count > 0 ? sum / static_cast<double>(count) : Color3{0.0, 0.0, 0.0};
    }
  }

  return result;
}

RenderResult render(const Integrator &integrator, const Scene &scene, const Sampler &sampler,
                    const RenderConfig &config) {
  const PerspectiveCamera &camera = scene.require_camera();
  const std::vector<Tile> tiles = make_tiles(camera.width(), camera.height());

  std::size_t n_threads = config.n_threads;
  if (n_threads == 0)
    n_threads = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
  if (n_threads > tiles.size())
    n_threads = tiles.size();

  RLOG_INFO("Rendering {}x{} at {} spp: {} tiles on {} threads", camera.width(), camera.height(),
            sampler.sample_count(), tiles.size(), n_threads);
  const auto t0 = std::chrono::steady_clock::now();

  std::vector<std::optional<TileResult>> results(tiles.size());
  std::atomic<std::size_t> next_tile{0};

  std::vector<std::thread> workers;
  workers.reserve(n_threads);
  std::atomic<bool> any_error{false};
  std::exception_ptr thread_exception = nullptr;
  std::mutex exception_mutex;

  for (std::size_t t = 0; t < n_threads; ++t) {
    workers.emplace_back([&, t]() {
      try {
        std::size_t rendered = 0;
        while (!any_error.load(std::memory_order_relaxed)) {
          const std::size_t i = next_tile.fetch_add(1, std::memory_order_relaxed);
          if (i >= tiles.size())
            break;
          auto tile_sampler = sampler.clone_independent_stream(tiles[i].index);
          results[i] = render_tile(integrator, scene, *tile_sampler, tiles[i], config);
          ++rendered;
        }
        RLOG_DEBUG("Thread {} rendered {} tiles", t, rendered);
      } catch (...) {
        std::scoped_lock lk(exception_mutex);
        if (!thread_exception)
          thread_exception = std::current_exception();
        any_error.store(true, std::memory_order_relaxed);
      }
    });
  }

  for (auto &th : workers)
    th.join();
  if (thread_exception)
    std::rethrow_exception(thread_exception);

  RenderResult out{Image(camera.width(), camera.height()), RenderStats{}};
  for (std::size_t i = 0; i < tiles.size(); ++i) {
    out.image.copy_tile(results[i]->image, tiles[i].x0, tiles[i].y0);
    out.stats.merge_from(results[i]->stats);
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
  RLOG_INFO("Render finished in {:.3f} s", elapsed.count());
  RLOG_INFO("Stats:");
  RLOG_INFO(" - #intersections: {}", out.stats.intersections);
  RLOG_INFO(" - #rays(traced) : {}", out.stats.traced_rays);
  RLOG_INFO(" - #intersections/#ray(traced): {}", out.stats.intersections_per_ray());
  if (out.stats.raymarch_steps > 0) {
    RLOG_INFO(" - raymarch: {} steps, {} hits, {} misses, {} escaped, {} exhausted", out.stats.raymarch_steps,
              out.stats.raymarch_hits, out.stats.raymarch_misses, out.stats.raymarch_escaped,
              out.stats.raymarch_exhausted);
  }
  if (out.stats.rejected_samples > 0)
    RLOG_WARN(" - {} non-finite samples rejected", out.stats.rejected_samples);

  return out;
}

} // namespace radiant::core
