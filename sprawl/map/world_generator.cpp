#include "world_generator.h"
#include "world.h"

#include <QDebug>
#include <algorithm>
#include <cstddef>
#include <utility>

namespace Sprawl::Map {

WorldMap::WorldMap(QString name, int width, int height,
                   std::vector<TilePtr> tiles,
                   SpatialIndexSettings index_settings)
    : m_name(std::move(name)), m_width(std::max(width, 0)),
      m_height(std::max(height, 0)),
      m_tiles(std::move(tiles)), m_index_settings(index_settings) {
  std::size_t const expected = static_cast<std::size_t>(m_width) *
                               static_cast<std::size_t>(m_height);
  if (m_tiles.size() != expected) {
    qWarning() << "WorldMap: expected" << expected << "tiles, got"
               << m_tiles.size();
    m_tiles.resize(expected);
  }
}

auto WorldMap::tile_at(int x, int y) const -> TilePtr {
  if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
    return nullptr;
  }
  return m_tiles[static_cast<std::size_t>(y) * m_width + x];
}

auto WorldMap::walkable_map() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> walkable(m_tiles.size(), 0);
  for (std::size_t i = 0; i < m_tiles.size(); ++i) {
    if (m_tiles[i] && is_walkable(m_tiles[i]->type)) {
      walkable[i] = 1;
    }
  }
  return walkable;
}

auto WorldMap::build_spatial_index() const -> std::unique_ptr<SpatialIndex> {
  auto index = std::make_unique<SpatialIndex>(m_width, m_height,
                                              m_index_settings.max_objects,
                                              m_index_settings.max_levels);
  for (const auto &tile : m_tiles) {
    if (tile) {
      index->insert(tile);
    }
  }
  return index;
}

auto WorldMap::count_by_type() const -> std::map<TileType, int> {
  std::map<TileType, int> counts;
  for (const auto &tile : m_tiles) {
    if (tile) {
      ++counts[tile->type];
    }
  }
  return counts;
}

WorldGenerator::WorldGenerator(WorldConfig config)
    : m_config(std::move(config)) {}

auto WorldGenerator::generate() const -> WorldMap {
  WorldConfig uncached = m_config;
  uncached.max_cache_size = 0;
  World world(uncached);

  int const width = m_config.grid.width;
  int const height = m_config.grid.height;
  std::vector<TilePtr> tiles;
  tiles.reserve(static_cast<std::size_t>(width) *
                static_cast<std::size_t>(height));
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      tiles.push_back(world.tile_at(x, y));
    }
  }

  qDebug() << "WorldGenerator: generated" << m_config.name << width << "x"
           << height;
  return WorldMap(m_config.name, width, height, std::move(tiles),
                  m_config.spatial_index);
}

} // namespace Sprawl::Map
