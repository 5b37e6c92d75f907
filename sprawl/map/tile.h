#pragma once

#include <QString>
#include <array>
#include <memory>
#include <optional>
#include <string>

namespace Sprawl::Map {

enum class TileType {
  Unknown,
  Water,
  Sand,
  Wetland,
  Concrete,
  Asphalt,
  Metal,
  Tiles,
  Solar,
  Garden,
  Grass,
  Dirt,
  Forest,
  Mountain
};

inline constexpr std::array<TileType, 13> k_all_tile_types{
    TileType::Water,  TileType::Sand,    TileType::Wetland, TileType::Concrete,
    TileType::Asphalt, TileType::Metal,  TileType::Tiles,   TileType::Solar,
    TileType::Garden, TileType::Grass,   TileType::Dirt,    TileType::Forest,
    TileType::Mountain};

inline auto tile_type_to_qstring(TileType type) -> QString {
  switch (type) {
  case TileType::Water:
    return QStringLiteral("water");
  case TileType::Sand:
    return QStringLiteral("sand");
  case TileType::Wetland:
    return QStringLiteral("wetland");
  case TileType::Concrete:
    return QStringLiteral("concrete");
  case TileType::Asphalt:
    return QStringLiteral("asphalt");
  case TileType::Metal:
    return QStringLiteral("metal");
  case TileType::Tiles:
    return QStringLiteral("tiles");
  case TileType::Solar:
    return QStringLiteral("solar");
  case TileType::Garden:
    return QStringLiteral("garden");
  case TileType::Grass:
    return QStringLiteral("grass");
  case TileType::Dirt:
    return QStringLiteral("dirt");
  case TileType::Forest:
    return QStringLiteral("forest");
  case TileType::Mountain:
    return QStringLiteral("mountain");
  case TileType::Unknown:
    break;
  }
  return QStringLiteral("unknown");
}

inline auto tile_type_to_string(TileType type) -> std::string {
  return tile_type_to_qstring(type).toStdString();
}

inline auto try_parse_tile_type(const QString &value, TileType &out) -> bool {
  const QString lowered = value.trimmed().toLower();
  for (TileType const type : k_all_tile_types) {
    if (lowered == tile_type_to_qstring(type)) {
      out = type;
      return true;
    }
  }
  return false;
}

inline auto
tile_type_from_string(const std::string &str) -> std::optional<TileType> {
  TileType result;
  if (try_parse_tile_type(QString::fromStdString(str), result)) {
    return result;
  }
  return std::nullopt;
}

// Water, wetland and untyped tiles block movement.
inline auto is_walkable(TileType type) -> bool {
  return type != TileType::Water && type != TileType::Wetland &&
         type != TileType::Unknown;
}

inline auto make_tile_id(int x, int y) -> QString {
  return QStringLiteral("tile_%1_%2").arg(x).arg(y);
}

struct Tile {
  TileType type = TileType::Unknown;
  double height = 0.0;
  double moisture = 0.0;
  int variant = 0;
  QString id;
  int x = 0;
  int y = 0;
};

using TilePtr = std::shared_ptr<const Tile>;

} // namespace Sprawl::Map
