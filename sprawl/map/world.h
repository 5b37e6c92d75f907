#pragma once

#include "noise_field.h"
#include "terrain_generator.h"
#include "tile.h"
#include "world_config.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

namespace Sprawl::Map {

/**
 * @brief Lazily generated tile world.
 *
 * Tiles are produced on first access from the height, moisture and urban
 * density noise channels and kept in a bounded cache. When the cache is full
 * the oldest inserted tile is evicted first. With a seeded random mode an
 * evicted tile regenerates identically.
 */
class World {
public:
  explicit World(const WorldConfig &config = {});

  /**
   * @brief Tile at (x, y), generated on demand.
   * @return nullptr when the coordinates lie outside the world.
   */
  auto tile_at(int x, int y) -> TilePtr;

  /**
   * @brief Tiles of chunk (chunk_x, chunk_y) in row-major order.
   *
   * Cells of the chunk that fall outside the world are skipped.
   */
  auto generate_chunk(int chunk_x, int chunk_y) -> std::vector<TilePtr>;

  void clear_cache();

  [[nodiscard]] auto in_bounds(int x, int y) const -> bool {
    return x >= 0 && x < m_config.grid.width && y >= 0 &&
           y < m_config.grid.height;
  }

  [[nodiscard]] auto width() const -> int { return m_config.grid.width; }
  [[nodiscard]] auto height() const -> int { return m_config.grid.height; }
  [[nodiscard]] auto chunk_size() const -> int {
    return m_config.grid.chunk_size;
  }
  [[nodiscard]] auto cache_size() const -> std::size_t {
    return m_cache.size();
  }
  [[nodiscard]] auto max_cache_size() const -> int {
    return m_config.max_cache_size;
  }
  [[nodiscard]] auto config() const -> const WorldConfig & { return m_config; }

private:
  static auto pack_key(int x, int y) -> std::uint64_t {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32) |
           static_cast<std::uint32_t>(y);
  }

  [[nodiscard]] auto generate_tile(int x, int y) const -> Tile;

  WorldConfig m_config;
  NoiseField m_height_noise;
  NoiseField m_moisture_noise;
  NoiseField m_urban_noise;
  TerrainGenerator m_terrain;

  std::unordered_map<std::uint64_t, TilePtr> m_cache;
  std::deque<std::uint64_t> m_insertion_order;
};

} // namespace Sprawl::Map
