#pragma once

#include "../map/tile.h"
#include "../map/world_generator.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Sprawl::Core {

class Serialization {
public:
  static auto serialize_tile(const Map::Tile &tile) -> QJsonObject;

  /**
   * @brief Decode a tile record.
   * @return std::nullopt when x or y is missing or the type is not a known
   *         tile type. The id is rebuilt from the coordinates when absent.
   */
  static auto deserialize_tile(const QJsonObject &json)
      -> std::optional<Map::Tile>;

  static auto serialize_world_map(const Map::WorldMap &map) -> QJsonDocument;
  static auto deserialize_world_map(const QJsonDocument &doc,
                                    QString *out_error = nullptr)
      -> std::optional<Map::WorldMap>;

  static auto save_to_file(const QString &filename,
                           const QJsonDocument &doc) -> bool;
  static auto load_from_file(const QString &filename, QJsonDocument &out_doc,
                             QString *out_error = nullptr) -> bool;
};

} // namespace Sprawl::Core
