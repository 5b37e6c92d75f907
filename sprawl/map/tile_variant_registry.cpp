#include "tile_variant_registry.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace Sprawl::Map {

TileVariantRegistry::TileVariantRegistry() = default;

auto TileVariantRegistry::with_defaults() -> TileVariantRegistry {
  TileVariantRegistry registry;
  registry.set_variant_count(TileType::Water, 2);
  registry.set_variant_count(TileType::Sand, 2);
  registry.set_variant_count(TileType::Wetland, 1);
  registry.set_variant_count(TileType::Concrete, 3);
  registry.set_variant_count(TileType::Asphalt, 2);
  registry.set_variant_count(TileType::Metal, 2);
  registry.set_variant_count(TileType::Tiles, 2);
  registry.set_variant_count(TileType::Solar, 1);
  registry.set_variant_count(TileType::Garden, 2);
  registry.set_variant_count(TileType::Grass, 2);
  registry.set_variant_count(TileType::Dirt, 2);
  registry.set_variant_count(TileType::Forest, 3);
  registry.set_variant_count(TileType::Mountain, 2);
  return registry;
}

void TileVariantRegistry::set_variant_count(TileType type, int count) {
  if (type == TileType::Unknown) {
    qWarning() << "TileVariantRegistry: cannot register variants for"
               << tile_type_to_qstring(type);
    return;
  }
  m_counts[type] = std::max(count, 0);
}

auto TileVariantRegistry::variant_count(TileType type) const -> int {
  auto it = m_counts.find(type);
  return it != m_counts.end() ? it->second : 0;
}

auto TileVariantRegistry::variant_for(TileType type, double roll) const
    -> int {
  const int count = variant_count(type);
  if (count <= 0) {
    return 0;
  }
  const int index = static_cast<int>(std::floor(roll * count));
  return std::clamp(index, 0, count - 1);
}

} // namespace Sprawl::Map
