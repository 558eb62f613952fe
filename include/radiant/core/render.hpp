#pragma once
#include <cstddef>
#include <cstdint>
#include <radiant/core/image.hpp>
#include <radiant/core/integrator.hpp>
#include <radiant/core/scene.hpp>
#include <radiant/core/stats.hpp>
#include <radiant/sample/sampler.hpp>
#include <vector>

namespace radiant::core {

/// Edge length of a render tile in pixels
inline constexpr std::size_t TILE_SIZE = 32;

struct RenderConfig {
  std::size_t n_threads{0};  ///< Worker threads, 0 = hardware concurrency
  bool ignore_nans{false};   ///< Drop non-finite samples from pixel averages

  RenderConfig() = default;
  RenderConfig(std::size_t n_threads, bool ignore_nans) : n_threads(n_threads), ignore_nans(ignore_nans) {}
};

/// @brief Image region rendered by one task
struct Tile {
  std::size_t index; ///< Stream index of the tile's sampler
  std::size_t x0;
  std::size_t y0;
  std::size_t width;
  std::size_t height;
};

/// @brief Split a width x height image into TILE_SIZE tiles clipped at the border
std::vector<Tile> make_tiles(std::size_t width, std::size_t height);

struct TileResult {
  Image image;
  RenderStats stats;
};

/// @brief Render one tile with `sampler`, which must be exclusive to this call
TileResult render_tile(const Integrator &integrator, const Scene &scene, Sampler &sampler, const Tile &tile,
                       const RenderConfig &config);

struct RenderResult {
  Image image;
  RenderStats stats;
};

/// @brief Render the scene camera's view in parallel tiles
///
/// Tile `i` is rendered with `sampler.clone_independent_stream(i)`, so the
/// output depends only on the sampler seed, never on the thread count or on
/// which worker picked up a tile. Exceptions thrown by a worker are rethrown
/// here after every worker has joined.
RenderResult render(const Integrator &integrator, const Scene &scene, const Sampler &sampler,
                    const RenderConfig &config = {});

} // namespace radiant::core
