#pragma once

#include "pathfinding_messages.h"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Sprawl::Systems::Protocol {

inline constexpr const char *TYPE = "type";

inline constexpr const char *INIT = "init";
inline constexpr const char *FIND_PATH = "findPath";
inline constexpr const char *UPDATE_MAP = "updateMap";
inline constexpr const char *UPDATE_TILE = "updateTile";

inline constexpr const char *INITIALIZED = "initialized";
inline constexpr const char *PATH_RESULT = "pathResult";
inline constexpr const char *MAP_UPDATED = "mapUpdated";
inline constexpr const char *TILE_UPDATED = "tileUpdated";
inline constexpr const char *ERROR_TYPE = "error";

inline constexpr const char *WIDTH = "width";
inline constexpr const char *HEIGHT = "height";
inline constexpr const char *WALKABLE_MAP = "walkableMap";
inline constexpr const char *ID = "id";
inline constexpr const char *START_X = "startX";
inline constexpr const char *START_Y = "startY";
inline constexpr const char *END_X = "endX";
inline constexpr const char *END_Y = "endY";
inline constexpr const char *PATH = "path";
inline constexpr const char *START = "start";
inline constexpr const char *END = "end";
inline constexpr const char *X = "x";
inline constexpr const char *Y = "y";
inline constexpr const char *WALKABLE = "walkable";
inline constexpr const char *MESSAGE = "message";

auto request_to_json(const WorkerRequest &request) -> QJsonObject;
auto request_from_json(const QJsonObject &json, QString *out_error = nullptr)
    -> std::optional<WorkerRequest>;

auto response_to_json(const WorkerResponse &response) -> QJsonObject;
auto response_from_json(const QJsonObject &json, QString *out_error = nullptr)
    -> std::optional<WorkerResponse>;

} // namespace Sprawl::Systems::Protocol
