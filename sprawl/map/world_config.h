#pragma once

#include "noise_field.h"
#include "terrain_generator.h"
#include "tile_variant_registry.h"
#include <QString>

namespace Sprawl::Map {

struct GridSettings {
  int width = 64;
  int height = 64;
  int chunk_size = 16;
};

struct SpatialIndexSettings {
  int max_objects = 10;
  int max_levels = 5;
};

struct WorldConfig {
  QString name = QStringLiteral("Unnamed World");
  GridSettings grid;
  TerrainSettings terrain;
  NoiseSettings height_noise{0.045F, 5, 0.5F, 2.0F, 0U};
  NoiseSettings moisture_noise{0.06F, 4, 0.55F, 2.0F, 7919U};
  NoiseSettings urban_noise{0.03F, 3, 0.5F, 2.0F, 104729U};
  SpatialIndexSettings spatial_index;
  int max_cache_size = 1000;
  TileVariantRegistry variants = TileVariantRegistry::with_defaults();
};

} // namespace Sprawl::Map
