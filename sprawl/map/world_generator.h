#pragma once

#include "spatial_index.h"
#include "tile.h"
#include "world_config.h"
#include <QString>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace Sprawl::Map {

/**
 * @brief A fully generated world: every tile of a width x height grid in
 * row-major order.
 */
class WorldMap {
public:
  WorldMap() = default;
  WorldMap(QString name, int width, int height, std::vector<TilePtr> tiles,
           SpatialIndexSettings index_settings = {});

  [[nodiscard]] auto tile_at(int x, int y) const -> TilePtr;

  /**
   * @brief Pathfinding bitmap, 1 where the tile type is walkable.
   */
  [[nodiscard]] auto walkable_map() const -> std::vector<std::uint8_t>;

  /**
   * @brief Fresh quadtree holding every tile of the map.
   */
  [[nodiscard]] auto build_spatial_index() const -> std::unique_ptr<SpatialIndex>;

  [[nodiscard]] auto count_by_type() const -> std::map<TileType, int>;

  [[nodiscard]] auto name() const -> const QString & { return m_name; }
  [[nodiscard]] auto width() const -> int { return m_width; }
  [[nodiscard]] auto height() const -> int { return m_height; }
  [[nodiscard]] auto tiles() const -> const std::vector<TilePtr> & {
    return m_tiles;
  }

private:
  QString m_name;
  int m_width = 0;
  int m_height = 0;
  std::vector<TilePtr> m_tiles;
  SpatialIndexSettings m_index_settings;
};

class WorldGenerator {
public:
  explicit WorldGenerator(WorldConfig config = {});

  [[nodiscard]] auto generate() const -> WorldMap;

  [[nodiscard]] auto config() const -> const WorldConfig & { return m_config; }

private:
  WorldConfig m_config;
};

} // namespace Sprawl::Map
