#pragma once

namespace Sprawl::Map::JsonKeys {

inline constexpr const char *NAME = "name";
inline constexpr const char *GRID = "grid";
inline constexpr const char *SEED = "seed";
inline constexpr const char *RANDOM_MODE = "randomMode";
inline constexpr const char *NOISE = "noise";
inline constexpr const char *SPATIAL_INDEX = "spatialIndex";
inline constexpr const char *TILE_CACHE = "tileCache";
inline constexpr const char *VARIANTS = "variants";

inline constexpr const char *WIDTH = "width";
inline constexpr const char *HEIGHT = "height";
inline constexpr const char *CHUNK_SIZE = "chunkSize";

inline constexpr const char *HEIGHT_FIELD = "height";
inline constexpr const char *MOISTURE_FIELD = "moisture";
inline constexpr const char *URBAN_FIELD = "urbanDensity";

inline constexpr const char *SCALE = "scale";
inline constexpr const char *OCTAVES = "octaves";
inline constexpr const char *PERSISTENCE = "persistence";
inline constexpr const char *LACUNARITY = "lacunarity";
inline constexpr const char *SEED_OFFSET = "seedOffset";

inline constexpr const char *MAX_OBJECTS = "maxObjects";
inline constexpr const char *MAX_LEVELS = "maxLevels";

inline constexpr const char *MAX_SIZE = "maxSize";

inline constexpr const char *RANDOM_MODE_SEEDED = "seeded";
inline constexpr const char *RANDOM_MODE_AMBIENT = "ambient";

inline constexpr const char *TILE_ID = "id";
inline constexpr const char *TILE_X = "x";
inline constexpr const char *TILE_Y = "y";
inline constexpr const char *TILE_TYPE = "type";
inline constexpr const char *TILE_HEIGHT = "height";
inline constexpr const char *TILE_MOISTURE = "moisture";
inline constexpr const char *TILE_VARIANT = "variant";
inline constexpr const char *TILES = "tiles";

} // namespace Sprawl::Map::JsonKeys
