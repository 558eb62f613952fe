#pragma once
#include <cstddef>
#include <radiant/math/vec.hpp>
#include <string>
#include <vector>

using namespace radiant::math;

namespace radiant::core {

/// @brief Row-major 2D array of linear RGB values, (0, 0) is the top-left pixel
struct Image {
  std::size_t width;
  std::size_t height;
  std::vector<Color3> data;

  Image(std::size_t width, std::size_t height);

  Color3 &operator()(std::size_t x, std::size_t y);
  const Color3 &operator()(std::size_t x, std::size_t y) const;

  /// @brief Copy `tile` into this image with its top-left pixel at (x0, y0)
  void copy_tile(const Image &tile, std::size_t x0, std::size_t y0);

  /// @brief Write a little-endian colour PFM file
  /// @throws std::runtime_error when the file cannot be written
  void save_pfm(const std::string &filename) const;
};

} // namespace radiant::core
