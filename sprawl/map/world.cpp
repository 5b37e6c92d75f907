#include "world.h"

#include <QDebug>
#include <memory>
#include <utility>
#include <vector>

namespace Sprawl::Map {

World::World(const WorldConfig &config)
    : m_config(config),
      m_height_noise(config.terrain.seed, config.height_noise),
      m_moisture_noise(config.terrain.seed, config.moisture_noise),
      m_urban_noise(config.terrain.seed, config.urban_noise),
      m_terrain(config.terrain, config.variants) {
  if (m_config.max_cache_size < 0) {
    qWarning() << "World: negative tile cache size" << m_config.max_cache_size
               << "treated as 0";
    m_config.max_cache_size = 0;
  }
}

auto World::generate_tile(int x, int y) const -> Tile {
  return m_terrain.generate_tile(x, y, m_height_noise.sample(x, y),
                                 m_moisture_noise.sample(x, y),
                                 m_urban_noise.sample(x, y));
}

auto World::tile_at(int x, int y) -> TilePtr {
  if (!in_bounds(x, y)) {
    return nullptr;
  }

  std::uint64_t const key = pack_key(x, y);
  auto it = m_cache.find(key);
  if (it != m_cache.end()) {
    return it->second;
  }

  auto tile = std::make_shared<const Tile>(generate_tile(x, y));
  if (m_config.max_cache_size == 0) {
    return tile;
  }

  while (static_cast<int>(m_cache.size()) >= m_config.max_cache_size &&
         !m_insertion_order.empty()) {
    m_cache.erase(m_insertion_order.front());
    m_insertion_order.pop_front();
  }
  m_cache.emplace(key, tile);
  m_insertion_order.push_back(key);
  return tile;
}

auto World::generate_chunk(int chunk_x, int chunk_y) -> std::vector<TilePtr> {
  int const size = m_config.grid.chunk_size;
  std::vector<TilePtr> chunk;
  chunk.reserve(static_cast<std::size_t>(size) * static_cast<std::size_t>(size));

  for (int local_y = 0; local_y < size; ++local_y) {
    for (int local_x = 0; local_x < size; ++local_x) {
      int const x = chunk_x * size + local_x;
      int const y = chunk_y * size + local_y;
      if (auto tile = tile_at(x, y)) {
        chunk.push_back(std::move(tile));
      }
    }
  }
  return chunk;
}

void World::clear_cache() {
  m_cache.clear();
  m_insertion_order.clear();
}

} // namespace Sprawl::Map
