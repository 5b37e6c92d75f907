#include "terrain_generator.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <utility>

namespace Sprawl::Map {

namespace {

constexpr std::uint64_t k_golden_gamma = 0x9e3779b97f4a7c15ULL;

inline auto splitmix64(std::uint64_t &state) -> std::uint64_t {
  state += k_golden_gamma;
  std::uint64_t z = state;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

auto ambient_draw() -> double {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(gen);
}

auto dense_urban_type(double roll) -> TileType {
  if (roll < 0.4) {
    return TileType::Concrete;
  }
  if (roll < 0.7) {
    return TileType::Asphalt;
  }
  if (roll < 0.8) {
    return TileType::Metal;
  }
  if (roll < 0.9) {
    return TileType::Tiles;
  }
  return TileType::Solar;
}

auto suburban_type(double roll) -> TileType {
  if (roll < 0.4) {
    return TileType::Garden;
  }
  if (roll < 0.7) {
    return TileType::Grass;
  }
  return TileType::Concrete;
}

} // namespace

TileRandom::TileRandom(RandomMode mode, std::uint32_t seed, int x, int y)
    : m_mode(mode),
      m_state(((static_cast<std::uint64_t>(static_cast<std::uint32_t>(x))
                << 32) |
               static_cast<std::uint32_t>(y)) ^
              (static_cast<std::uint64_t>(seed) * k_golden_gamma)) {}

auto TileRandom::next() -> double {
  if (m_mode == RandomMode::Ambient) {
    return ambient_draw();
  }
  // 53 high bits give a double in [0, 1).
  return static_cast<double>(splitmix64(m_state) >> 11) * 0x1.0p-53;
}

auto classify_tile(double height, double moisture, double urban_density,
                   double roll) -> TileType {
  using namespace Thresholds;

  if (height < k_water_height) {
    return TileType::Water;
  }

  if (height < k_coast_height) {
    if (urban_density > k_coastal_urban) {
      return TileType::Concrete;
    }
    return moisture > k_wetland_moisture ? TileType::Wetland : TileType::Sand;
  }

  if (height < k_mountain_height) {
    if (urban_density > k_dense_urban) {
      return dense_urban_type(roll);
    }
    if (urban_density > k_suburban) {
      return suburban_type(roll);
    }
    if (moisture < k_dry_moisture) {
      return TileType::Dirt;
    }
    return moisture > k_lush_moisture ? TileType::Forest : TileType::Grass;
  }

  if (urban_density > k_mountain_urban) {
    return roll < 0.7 ? TileType::Metal : TileType::Concrete;
  }
  return TileType::Mountain;
}

TerrainGenerator::TerrainGenerator(TerrainSettings settings,
                                   TileVariantRegistry variants)
    : m_settings(settings), m_variants(std::move(variants)) {}

auto TerrainGenerator::generate_tile(int x, int y, double height,
                                     double moisture,
                                     double urban_density) const -> Tile {
  TileRandom random(m_settings.random_mode, m_settings.seed, x, y);
  // The variant roll is always the second draw.
  double const type_roll = random.next();
  double const variant_roll = random.next();

  Tile tile;
  tile.type = classify_tile(height, moisture, urban_density, type_roll);
  tile.height = std::clamp(height, 0.0, 1.0);
  tile.moisture = std::clamp(moisture, 0.0, 1.0);
  tile.variant = m_variants.variant_for(tile.type, variant_roll);
  tile.id = make_tile_id(x, y);
  tile.x = x;
  tile.y = y;
  return tile;
}

} // namespace Sprawl::Map
