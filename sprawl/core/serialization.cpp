#include "serialization.h"
#include "../map/json_keys.h"
#include "../map/world_generator.h"
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonParseError>
#include <QJsonValue>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace Sprawl::Core {

using namespace Map::JsonKeys;

auto Serialization::serialize_tile(const Map::Tile &tile) -> QJsonObject {
  QJsonObject json;
  json[TILE_ID] = tile.id;
  json[TILE_X] = tile.x;
  json[TILE_Y] = tile.y;
  json[TILE_TYPE] = Map::tile_type_to_qstring(tile.type);
  json[TILE_HEIGHT] = tile.height;
  json[TILE_MOISTURE] = tile.moisture;
  json[TILE_VARIANT] = tile.variant;
  return json;
}

auto Serialization::deserialize_tile(const QJsonObject &json)
    -> std::optional<Map::Tile> {
  if (!json.value(TILE_X).isDouble() || !json.value(TILE_Y).isDouble()) {
    qWarning() << "Serialization: tile record without coordinates";
    return std::nullopt;
  }

  Map::Tile tile;
  if (!Map::try_parse_tile_type(json.value(TILE_TYPE).toString(),
                                tile.type)) {
    qWarning() << "Serialization: unknown tile type"
               << json.value(TILE_TYPE).toString();
    return std::nullopt;
  }

  tile.x = json.value(TILE_X).toInt();
  tile.y = json.value(TILE_Y).toInt();
  tile.height = json.value(TILE_HEIGHT).toDouble(0.0);
  tile.moisture = json.value(TILE_MOISTURE).toDouble(0.0);
  tile.variant = json.value(TILE_VARIANT).toInt(0);
  tile.id = json.contains(TILE_ID) ? json.value(TILE_ID).toString()
                                   : Map::make_tile_id(tile.x, tile.y);
  return tile;
}

auto Serialization::serialize_world_map(const Map::WorldMap &map)
    -> QJsonDocument {
  QJsonObject grid;
  grid[WIDTH] = map.width();
  grid[HEIGHT] = map.height();

  QJsonArray tiles;
  for (const auto &tile : map.tiles()) {
    if (tile) {
      tiles.append(serialize_tile(*tile));
    }
  }

  QJsonObject root;
  root[NAME] = map.name();
  root[GRID] = grid;
  root[TILES] = tiles;
  return QJsonDocument(root);
}

auto Serialization::deserialize_world_map(const QJsonDocument &doc,
                                          QString *out_error)
    -> std::optional<Map::WorldMap> {
  auto fail = [out_error](const QString &message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return std::nullopt;
  };

  if (!doc.isObject()) {
    return fail("World JSON root must be an object");
  }
  const auto root = doc.object();
  const auto grid = root.value(GRID).toObject();
  int const width = grid.value(WIDTH).toInt(0);
  int const height = grid.value(HEIGHT).toInt(0);
  if (width <= 0 || height <= 0) {
    return fail("Invalid grid specification");
  }

  std::vector<Map::TilePtr> tiles(static_cast<std::size_t>(width) *
                                  static_cast<std::size_t>(height));
  const auto tiles_array = root.value(TILES).toArray();
  for (const auto &value : tiles_array) {
    auto tile = deserialize_tile(value.toObject());
    if (!tile) {
      continue;
    }
    if (tile->x < 0 || tile->x >= width || tile->y < 0 || tile->y >= height) {
      qWarning() << "Serialization: tile" << tile->id
                 << "lies outside the grid";
      continue;
    }
    std::size_t const index =
        static_cast<std::size_t>(tile->y) * width + tile->x;
    tiles[index] = std::make_shared<const Map::Tile>(std::move(*tile));
  }

  return Map::WorldMap(root.value(NAME).toString(), width, height,
                       std::move(tiles));
}

auto Serialization::save_to_file(const QString &filename,
                                 const QJsonDocument &doc) -> bool {
  QFile file(filename);
  if (!file.open(QIODevice::WriteOnly)) {
    qWarning() << "Could not open file for writing:" << filename;
    return false;
  }
  return file.write(doc.toJson()) >= 0;
}

auto Serialization::load_from_file(const QString &filename,
                                   QJsonDocument &out_doc,
                                   QString *out_error) -> bool {
  QFile file(filename);
  if (!file.open(QIODevice::ReadOnly)) {
    if (out_error != nullptr) {
      *out_error = QString("Could not open file for reading: %1").arg(filename);
    }
    return false;
  }
  const QByteArray data = file.readAll();

  QJsonParseError perr;
  out_doc = QJsonDocument::fromJson(data, &perr);
  if (perr.error != QJsonParseError::NoError) {
    if (out_error != nullptr) {
      *out_error = QString("JSON parse error at %1: %2")
                       .arg(perr.offset)
                       .arg(perr.errorString());
    }
    return false;
  }
  return true;
}

} // namespace Sprawl::Core
