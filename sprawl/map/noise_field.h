#pragma once

#include <cstdint>

namespace Sprawl::Map {

inline auto hash_coords(int x, int y, std::uint32_t seed) -> std::uint32_t {
  std::uint32_t const ux = static_cast<std::uint32_t>(x) * 73856093U;
  std::uint32_t const uy = static_cast<std::uint32_t>(y) * 19349663U;
  std::uint32_t const s = seed * 83492791U + 0x9e3779b9U;
  return ux ^ uy ^ s;
}

inline auto hash_to_float01(std::uint32_t h) -> float {
  h ^= h >> 17;
  h *= 0xed5ad4bbU;
  h ^= h >> 11;
  h *= 0xac4c1b51U;
  h ^= h >> 15;
  h *= 0x31848babU;
  h ^= h >> 14;
  return (h & 0x00FFFFFFU) / float(0x01000000);
}

struct NoiseSettings {
  float scale = 0.05F;
  int octaves = 4;
  float persistence = 0.5F;
  float lacunarity = 2.0F;
  std::uint32_t seed_offset = 0;
};

/**
 * @brief Seeded fractal value noise sampled on the tile grid.
 *
 * Samples are in [0, 1] and depend only on (seed, settings, x, y).
 */
class NoiseField {
public:
  NoiseField(std::uint32_t seed, const NoiseSettings &settings);

  [[nodiscard]] auto sample(int x, int y) const -> double;

  [[nodiscard]] auto settings() const -> const NoiseSettings & {
    return m_settings;
  }

private:
  std::uint32_t m_seed;
  NoiseSettings m_settings;
};

} // namespace Sprawl::Map
