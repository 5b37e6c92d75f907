#pragma once

#include "tile.h"
#include <unordered_map>

namespace Sprawl::Map {

/**
 * @brief Number of cosmetic variants available for each tile type.
 *
 * The renderer owns the textures; this registry only knows how many variants
 * exist so generation can pick one.
 */
class TileVariantRegistry {
public:
  TileVariantRegistry();

  static auto with_defaults() -> TileVariantRegistry;

  void set_variant_count(TileType type, int count);
  [[nodiscard]] auto variant_count(TileType type) const -> int;

  /**
   * @brief Map a uniform roll in [0, 1) to a variant index.
   * @return 0 for types without variants.
   */
  [[nodiscard]] auto variant_for(TileType type, double roll) const -> int;

  void clear() { m_counts.clear(); }

private:
  std::unordered_map<TileType, int> m_counts;
};

} // namespace Sprawl::Map
