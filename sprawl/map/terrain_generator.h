#pragma once

#include "tile.h"
#include "tile_variant_registry.h"
#include <cstdint>

namespace Sprawl::Map {

namespace Thresholds {
inline constexpr double k_water_height = 0.38;
inline constexpr double k_coast_height = 0.42;
inline constexpr double k_mountain_height = 0.8;

inline constexpr double k_coastal_urban = 0.7;
inline constexpr double k_wetland_moisture = 0.6;

inline constexpr double k_dense_urban = 0.8;
inline constexpr double k_suburban = 0.5;
inline constexpr double k_dry_moisture = 0.2;
inline constexpr double k_lush_moisture = 0.6;

inline constexpr double k_mountain_urban = 0.7;
} // namespace Thresholds

// Seeded draws are reproducible per (seed, x, y); ambient draws are not.
enum class RandomMode { Seeded, Ambient };

/**
 * @brief Uniform draws in [0, 1) for generating one tile.
 *
 * In seeded mode the stream is a splitmix64 sequence keyed by (seed, x, y),
 * so regenerating a cell yields the same tile. In ambient mode draws come
 * from a thread-local std::mt19937 seeded by std::random_device.
 */
class TileRandom {
public:
  TileRandom(RandomMode mode, std::uint32_t seed, int x, int y);

  auto next() -> double;

private:
  RandomMode m_mode;
  std::uint64_t m_state;
};

/**
 * @brief First-match classification of a cell.
 *
 * roll is a uniform draw in [0, 1) used only by the weighted urban and
 * mountain branches.
 */
auto classify_tile(double height, double moisture, double urban_density,
                   double roll) -> TileType;

struct TerrainSettings {
  std::uint32_t seed = 1337U;
  RandomMode random_mode = RandomMode::Seeded;
};

class TerrainGenerator {
public:
  explicit TerrainGenerator(
      TerrainSettings settings = {},
      TileVariantRegistry variants = TileVariantRegistry::with_defaults());

  [[nodiscard]] auto generate_tile(int x, int y, double height,
                                   double moisture,
                                   double urban_density = 0.0) const -> Tile;

  [[nodiscard]] auto settings() const -> const TerrainSettings & {
    return m_settings;
  }
  [[nodiscard]] auto variants() const -> const TileVariantRegistry & {
    return m_variants;
  }

private:
  TerrainSettings m_settings;
  TileVariantRegistry m_variants;
};

} // namespace Sprawl::Map
