#include <fstream>
#include <radiant/core/image.hpp>
#include <radiant/log/logger.hpp>
#include <stdexcept>

namespace radiant::core
{
  Image::Image(std::size_t width, std::size_t height) : width(width), height(height)
  {
    data.resize(width * height, Color3{0.0, 0.0, 0.0});
  }

  Color3 &Image::operator()(std::size_t x, std::size_t y)
  {
    if (x >= width || y >= height)
    {
      RLOG_ERROR("Image index ({}, {}) out of range for {}x{}", x, y, width, height);
      throw std::out_of_range("Image index out of range");
    }
    return data[y * width + x];
  }

  const Color3 &Image::operator()(std::size_t x, std::size_t y) const
  {
    if (x >= width || y >= height)
    {
      RLOG_ERROR("Image index ({}, {}) out of range for {}x{}", x, y, width, height);
      throw std::out_of_range("Image index out of range");
    }
    return data[y * width + x];
  }

  void Image::copy_tile(const Image &tile, std::size_t x0, std::size_t y0)
  {
    if (x0 + tile.width > width || y0 + tile.height > height)
    {
      RLOG_ERROR("Tile {}x{} at ({}, {}) does not fit in {}x{}", tile.width, tile.height, x0, y0, width, height);
      throw std::out_of_range("Tile does not fit in image");
    }

    for (std::size_t y = 0; y < tile.height; ++y)
    {
      for (std::size_t x = 0; x < tile.width; ++x)
      {
        data[(y0 + y) * width + (x0 + x)] = tile.data[y * tile.width + x];
      }
    }
  }

  void Image::save_pfm(const std::string &filename) const
  {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
      RLOG_ERROR("Could not open {} for writing", filename);
      throw std::runtime_error("Could not open file for writing: " + filename);
    }

    // Negative scale marks little-endian samples
    file << "PF\n" << width << " " << height << "\n-1.0\n";

    // PFM scanlines run bottom to top
    std::vector<float> row(width * 3);
    for (std::size_t r = 0; r < height; ++r)
    {
      const std::size_t y = height - 1 - r;
      for (std::size_t x = 0; x < width; ++x)
      {
        const Color3 &c = data[y * width + x];
        row[3 * x + 0] = static_cast<float>(c.x);
        row[3 * x + 1] = static_cast<float>(c.y);
        row[3 * x + 2] = static_cast<float>(c.z);
      }
      file.write(reinterpret_cast<const char *>(row.data()), static_cast<std::streamsize>(row.size() * sizeof(float)));
    }

    if (!file)
    {
      RLOG_ERROR("Failed while writing {}", filename);
      throw std::runtime_error("Failed while writing: " + filename);
    }
  }
}
