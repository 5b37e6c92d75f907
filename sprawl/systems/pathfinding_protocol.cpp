#include "pathfinding_protocol.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <cstdint>
#include <optional>

namespace Sprawl::Systems::Protocol {

namespace {

auto point_to_json(const Point &point) -> QJsonObject {
  QJsonObject json;
  json[X] = point.x;
  json[Y] = point.y;
  return json;
}

auto read_int(const QJsonObject &json, const char *key, int &out) -> bool {
  const QJsonValue value = json.value(key);
  if (!value.isDouble()) {
    return false;
  }
  out = value.toInt();
  return true;
}

auto read_point(const QJsonValue &value, Point &out) -> bool {
  if (!value.isObject()) {
    return false;
  }
  const QJsonObject obj = value.toObject();
  return read_int(obj, X, out.x) && read_int(obj, Y, out.y);
}

// Accepts true/false as well as the 0/1 the bitmap uses.
auto read_flag(const QJsonValue &value, bool &out) -> bool {
  if (value.isBool()) {
    out = value.toBool();
    return true;
  }
  if (value.isDouble()) {
    out = value.toDouble() != 0.0;
    return true;
  }
  return false;
}

auto walkable_map_to_json(const WalkableMap &map) -> QJsonArray {
  QJsonArray array;
  for (std::uint8_t const cell : map) {
    array.append(cell != 0 ? 1 : 0);
  }
  return array;
}

auto read_walkable_map(const QJsonValue &value, WalkableMap &out) -> bool {
  if (!value.isArray()) {
    return false;
  }
  const QJsonArray array = value.toArray();
  out.clear();
  out.reserve(static_cast<std::size_t>(array.size()));
  for (const QJsonValue &cell : array) {
    bool walkable = false;
    if (!read_flag(cell, walkable)) {
      return false;
    }
    out.push_back(static_cast<std::uint8_t>(walkable ? 1 : 0));
  }
  return true;
}

auto reject(const QString &reason, QString *out_error) -> std::nullopt_t {
  qWarning() << "PathfindingProtocol:" << reason;
  if (out_error != nullptr) {
    *out_error = reason;
  }
  return std::nullopt;
}

} // namespace

auto request_to_json(const WorkerRequest &request) -> QJsonObject {
  QJsonObject json;
  switch (request.type) {
  case WorkerRequestType::Init:
    json[TYPE] = INIT;
    json[WIDTH] = request.width;
    json[HEIGHT] = request.height;
    json[WALKABLE_MAP] = walkable_map_to_json(request.walkable_map);
    break;
  case WorkerRequestType::FindPath:
    json[TYPE] = FIND_PATH;
    json[ID] = static_cast<qint64>(request.request_id);
    json[START_X] = request.start.x;
    json[START_Y] = request.start.y;
    json[END_X] = request.end.x;
    json[END_Y] = request.end.y;
    break;
  case WorkerRequestType::UpdateMap:
    json[TYPE] = UPDATE_MAP;
    json[WALKABLE_MAP] = walkable_map_to_json(request.walkable_map);
    break;
  case WorkerRequestType::UpdateTile:
    json[TYPE] = UPDATE_TILE;
    json[X] = request.x;
    json[Y] = request.y;
    json[WALKABLE] = request.walkable;
    break;
  }
  return json;
}

auto request_from_json(const QJsonObject &json, QString *out_error)
    -> std::optional<WorkerRequest> {
  const QString type = json.value(TYPE).toString();
  WorkerRequest request;

  if (type == QLatin1String(INIT)) {
    request.type = WorkerRequestType::Init;
    if (!read_int(json, WIDTH, request.width) ||
        !read_int(json, HEIGHT, request.height) ||
        !read_walkable_map(json.value(WALKABLE_MAP), request.walkable_map)) {
      return reject(QStringLiteral("malformed init message"), out_error);
    }
    return request;
  }

  if (type == QLatin1String(FIND_PATH)) {
    request.type = WorkerRequestType::FindPath;
    const QJsonValue id = json.value(ID);
    if (!id.isDouble() || !read_int(json, START_X, request.start.x) ||
        !read_int(json, START_Y, request.start.y) ||
        !read_int(json, END_X, request.end.x) ||
        !read_int(json, END_Y, request.end.y)) {
      return reject(QStringLiteral("malformed findPath message"), out_error);
    }
    request.request_id = static_cast<std::uint64_t>(id.toInteger());
    return request;
  }

  if (type == QLatin1String(UPDATE_MAP)) {
    request.type = WorkerRequestType::UpdateMap;
    if (!read_walkable_map(json.value(WALKABLE_MAP), request.walkable_map)) {
      return reject(QStringLiteral("malformed updateMap message"), out_error);
    }
    return request;
  }

  if (type == QLatin1String(UPDATE_TILE)) {
    request.type = WorkerRequestType::UpdateTile;
    if (!read_int(json, X, request.x) || !read_int(json, Y, request.y) ||
        !read_flag(json.value(WALKABLE), request.walkable)) {
      return reject(QStringLiteral("malformed updateTile message"), out_error);
    }
    return request;
  }

  return reject(QStringLiteral("unknown request type '%1'").arg(type),
                out_error);
}

auto response_to_json(const WorkerResponse &response) -> QJsonObject {
  QJsonObject json;
  switch (response.type) {
  case WorkerResponseType::Initialized:
    json[TYPE] = INITIALIZED;
    break;
  case WorkerResponseType::PathResult: {
    json[TYPE] = PATH_RESULT;
    json[ID] = static_cast<qint64>(response.request_id);
    if (response.path) {
      QJsonArray path;
      for (const auto &point : *response.path) {
        path.append(point_to_json(point));
      }
      json[PATH] = path;
    } else {
      json[PATH] = QJsonValue(QJsonValue::Null);
    }
    json[START] = point_to_json(response.start);
    json[END] = point_to_json(response.end);
    break;
  }
  case WorkerResponseType::MapUpdated:
    json[TYPE] = MAP_UPDATED;
    break;
  case WorkerResponseType::TileUpdated:
    json[TYPE] = TILE_UPDATED;
    json[X] = response.x;
    json[Y] = response.y;
    json[WALKABLE] = response.walkable;
    break;
  case WorkerResponseType::Error:
    json[TYPE] = ERROR_TYPE;
    json[MESSAGE] = response.message;
    break;
  }
  return json;
}

auto response_from_json(const QJsonObject &json, QString *out_error)
    -> std::optional<WorkerResponse> {
  const QString type = json.value(TYPE).toString();

  if (type == QLatin1String(INITIALIZED)) {
    return WorkerResponse::of(WorkerResponseType::Initialized);
  }

  if (type == QLatin1String(MAP_UPDATED)) {
    return WorkerResponse::of(WorkerResponseType::MapUpdated);
  }

  if (type == QLatin1String(PATH_RESULT)) {
    WorkerResponse response = WorkerResponse::of(WorkerResponseType::PathResult);
    const QJsonValue id = json.value(ID);
    if (!id.isDouble() || !read_point(json.value(START), response.start) ||
        !read_point(json.value(END), response.end)) {
      return reject(QStringLiteral("malformed pathResult message"), out_error);
    }
    response.request_id = static_cast<std::uint64_t>(id.toInteger());

    const QJsonValue path_value = json.value(PATH);
    if (path_value.isArray()) {
      Path path;
      for (const QJsonValue &entry : path_value.toArray()) {
        Point point;
        if (!read_point(entry, point)) {
          return reject(QStringLiteral("malformed path point"), out_error);
        }
        path.push_back(point);
      }
      // An empty array means unreachable, same as null.
      if (!path.empty()) {
        response.path = std::move(path);
      }
    }
    return response;
  }

  if (type == QLatin1String(TILE_UPDATED)) {
    WorkerResponse response =
        WorkerResponse::of(WorkerResponseType::TileUpdated);
    if (!read_int(json, X, response.x) || !read_int(json, Y, response.y) ||
        !read_flag(json.value(WALKABLE), response.walkable)) {
      return reject(QStringLiteral("malformed tileUpdated message"),
                    out_error);
    }
    return response;
  }

  if (type == QLatin1String(ERROR_TYPE)) {
    return WorkerResponse::error(json.value(MESSAGE).toString());
  }

  return reject(QStringLiteral("unknown response type '%1'").arg(type),
                out_error);
}

} // namespace Sprawl::Systems::Protocol
