#include "noise_field.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

using Sprawl::Map::hash_coords;
using Sprawl::Map::hash_to_float01;

inline auto smooth_step(float t) -> float { return t * t * (3.0F - 2.0F * t); }

inline auto value_noise_2d(float x, float y, std::uint32_t seed) -> float {
  int const ix0 = static_cast<int>(std::floor(x));
  int const iy0 = static_cast<int>(std::floor(y));
  int const ix1 = ix0 + 1;
  int const iy1 = iy0 + 1;

  float const tx = smooth_step(x - static_cast<float>(ix0));
  float const ty = smooth_step(y - static_cast<float>(iy0));

  float const n00 = hash_to_float01(hash_coords(ix0, iy0, seed));
  float const n10 = hash_to_float01(hash_coords(ix1, iy0, seed));
  float const n01 = hash_to_float01(hash_coords(ix0, iy1, seed));
  float const n11 = hash_to_float01(hash_coords(ix1, iy1, seed));

  float const nx0 = n00 * (1.0F - tx) + n10 * tx;
  float const nx1 = n01 * (1.0F - tx) + n11 * tx;
  return nx0 * (1.0F - ty) + nx1 * ty;
}

} // namespace

namespace Sprawl::Map {

NoiseField::NoiseField(std::uint32_t seed, const NoiseSettings &settings)
    : m_seed(seed + settings.seed_offset), m_settings(settings) {
  m_settings.octaves = std::max(m_settings.octaves, 1);
}

auto NoiseField::sample(int x, int y) const -> double {
  float amplitude = 1.0F;
  float frequency = m_settings.scale;
  float total = 0.0F;
  float max_amplitude = 0.0F;

  for (int octave = 0; octave < m_settings.octaves; ++octave) {
    std::uint32_t const octave_seed =
        m_seed + static_cast<std::uint32_t>(octave) * 1013U;
    total += amplitude * value_noise_2d(static_cast<float>(x) * frequency,
                                        static_cast<float>(y) * frequency,
                                        octave_seed);
    max_amplitude += amplitude;
    amplitude *= m_settings.persistence;
    frequency *= m_settings.lacunarity;
  }

  if (max_amplitude <= 0.0F) {
    return 0.0;
  }
  return std::clamp(static_cast<double>(total / max_amplitude), 0.0, 1.0);
}

} // namespace Sprawl::Map
