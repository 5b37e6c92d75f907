#include "world_config_loader.h"
#include "json_keys.h"
#include "tile.h"

#include <QDebug>
#include <QFile>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>
#include <cstdint>

namespace Sprawl::Map {

using namespace JsonKeys;

namespace {

auto read_grid(const QJsonObject &obj, GridSettings &grid) -> bool {
  if (obj.contains(WIDTH)) {
    grid.width = obj.value(WIDTH).toInt(grid.width);
  }
  if (obj.contains(HEIGHT)) {
    grid.height = obj.value(HEIGHT).toInt(grid.height);
  }
  if (obj.contains(CHUNK_SIZE)) {
    grid.chunk_size = obj.value(CHUNK_SIZE).toInt(grid.chunk_size);
  }
  return grid.width > 0 && grid.height > 0 && grid.chunk_size > 0;
}

auto read_noise(const QJsonObject &obj, NoiseSettings &noise) -> bool {
  if (obj.contains(SCALE)) {
    noise.scale = float(obj.value(SCALE).toDouble(noise.scale));
  }
  if (obj.contains(OCTAVES)) {
    noise.octaves = obj.value(OCTAVES).toInt(noise.octaves);
  }
  if (obj.contains(PERSISTENCE)) {
    noise.persistence =
        float(obj.value(PERSISTENCE).toDouble(noise.persistence));
  }
  if (obj.contains(LACUNARITY)) {
    noise.lacunarity = float(obj.value(LACUNARITY).toDouble(noise.lacunarity));
  }
  if (obj.contains(SEED_OFFSET)) {
    noise.seed_offset = static_cast<std::uint32_t>(
        obj.value(SEED_OFFSET).toInteger(noise.seed_offset));
  }
  return noise.scale > 0.0F && noise.octaves > 0 && noise.persistence > 0.0F &&
         noise.lacunarity > 0.0F;
}

auto read_spatial_index(const QJsonObject &obj,
                        SpatialIndexSettings &index) -> bool {
  if (obj.contains(MAX_OBJECTS)) {
    index.max_objects = obj.value(MAX_OBJECTS).toInt(index.max_objects);
  }
  if (obj.contains(MAX_LEVELS)) {
    index.max_levels = obj.value(MAX_LEVELS).toInt(index.max_levels);
  }
  return index.max_objects > 0 && index.max_levels >= 0;
}

void read_variants(const QJsonObject &obj, TileVariantRegistry &variants) {
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    TileType type = TileType::Unknown;
    if (!try_parse_tile_type(it.key(), type)) {
      qWarning() << "WorldConfigLoader: unknown tile type in variants:"
                 << it.key();
      continue;
    }
    int const count = it.value().toInt(-1);
    if (count < 0) {
      qWarning() << "WorldConfigLoader: invalid variant count for" << it.key();
      continue;
    }
    variants.set_variant_count(type, count);
  }
}

auto set_error(QString *out_error, const QString &message) -> bool {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

} // namespace

auto WorldConfigLoader::load_from_json_file(const QString &path,
                                            WorldConfig &out_config,
                                            QString *out_error) -> bool {
  QFile config_file(path);
  if (!config_file.open(QIODevice::ReadOnly)) {
    return set_error(out_error,
                     QString("Failed to open world config: %1").arg(path));
  }
  auto data = config_file.readAll();
  config_file.close();

  QJsonParseError perr;
  auto doc = QJsonDocument::fromJson(data, &perr);
  if (perr.error != QJsonParseError::NoError) {
    return set_error(out_error, QString("JSON parse error at %1: %2")
                                    .arg(perr.offset)
                                    .arg(perr.errorString()));
  }
  if (!doc.isObject()) {
    return set_error(out_error, "World config JSON root must be an object");
  }
  return load_from_json(doc.object(), out_config, out_error);
}

auto WorldConfigLoader::load_from_json(const QJsonObject &root,
                                       WorldConfig &out_config,
                                       QString *out_error) -> bool {
  if (root.contains(NAME)) {
    out_config.name = root.value(NAME).toString(out_config.name);
  }

  if (root.contains(SEED)) {
    out_config.terrain.seed = static_cast<std::uint32_t>(
        root.value(SEED).toInteger(out_config.terrain.seed));
  }

  if (root.contains(RANDOM_MODE)) {
    const QString mode = root.value(RANDOM_MODE).toString().trimmed().toLower();
    if (mode == RANDOM_MODE_AMBIENT) {
      out_config.terrain.random_mode = RandomMode::Ambient;
    } else if (mode == RANDOM_MODE_SEEDED) {
      out_config.terrain.random_mode = RandomMode::Seeded;
    } else {
      return set_error(out_error,
                       QString("Unknown random mode: %1").arg(mode));
    }
  }

  if (root.contains(GRID) && root.value(GRID).isObject()) {
    if (!read_grid(root.value(GRID).toObject(), out_config.grid)) {
      return set_error(out_error, "Invalid grid specification");
    }
  }

  if (root.contains(NOISE) && root.value(NOISE).isObject()) {
    auto noise = root.value(NOISE).toObject();
    struct NoiseSection {
      const char *key;
      NoiseSettings *settings;
    };
    NoiseSection const sections[] = {
        {HEIGHT_FIELD, &out_config.height_noise},
        {MOISTURE_FIELD, &out_config.moisture_noise},
        {URBAN_FIELD, &out_config.urban_noise}};
    for (const auto &section : sections) {
      if (!noise.contains(section.key) ||
          !noise.value(section.key).isObject()) {
        continue;
      }
      if (!read_noise(noise.value(section.key).toObject(),
                      *section.settings)) {
        return set_error(
            out_error,
            QString("Invalid noise settings for %1").arg(section.key));
      }
    }
  }

  if (root.contains(SPATIAL_INDEX) && root.value(SPATIAL_INDEX).isObject()) {
    if (!read_spatial_index(root.value(SPATIAL_INDEX).toObject(),
                            out_config.spatial_index)) {
      return set_error(out_error, "Invalid spatial index settings");
    }
  }

  if (root.contains(TILE_CACHE) && root.value(TILE_CACHE).isObject()) {
    auto cache = root.value(TILE_CACHE).toObject();
    out_config.max_cache_size =
        cache.value(MAX_SIZE).toInt(out_config.max_cache_size);
    if (out_config.max_cache_size < 0) {
      return set_error(out_error, "Tile cache size must not be negative");
    }
  }

  if (root.contains(VARIANTS) && root.value(VARIANTS).isObject()) {
    read_variants(root.value(VARIANTS).toObject(), out_config.variants);
  }

  return true;
}

} // namespace Sprawl::Map
