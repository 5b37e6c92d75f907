#pragma once

#include "pathfinding.h"
#include <QString>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace Sprawl::Systems {

using WalkableMap = std::vector<std::uint8_t>;

enum class WorkerRequestType { Init, FindPath, UpdateMap, UpdateTile };

enum class WorkerResponseType {
  Initialized,
  PathResult,
  MapUpdated,
  TileUpdated,
  Error
};

struct WorkerRequest {
  WorkerRequestType type = WorkerRequestType::FindPath;

  // Init
  int width = 0;
  int height = 0;
  // Init, UpdateMap
  WalkableMap walkable_map;

  // FindPath
  std::uint64_t request_id = 0;
  Point start;
  Point end;

  // UpdateTile
  int x = 0;
  int y = 0;
  bool walkable = true;

  static auto init(int width, int height,
                   WalkableMap walkable_map) -> WorkerRequest {
    WorkerRequest request;
    request.type = WorkerRequestType::Init;
    request.width = width;
    request.height = height;
    request.walkable_map = std::move(walkable_map);
    return request;
  }

  static auto find_path(std::uint64_t request_id, const Point &start,
                        const Point &end) -> WorkerRequest {
    WorkerRequest request;
    request.type = WorkerRequestType::FindPath;
    request.request_id = request_id;
    request.start = start;
    request.end = end;
    return request;
  }

  static auto update_map(WalkableMap walkable_map) -> WorkerRequest {
    WorkerRequest request;
    request.type = WorkerRequestType::UpdateMap;
    request.walkable_map = std::move(walkable_map);
    return request;
  }

  static auto update_tile(int x, int y, bool walkable) -> WorkerRequest {
    WorkerRequest request;
    request.type = WorkerRequestType::UpdateTile;
    request.x = x;
    request.y = y;
    request.walkable = walkable;
    return request;
  }
};

struct WorkerResponse {
  WorkerResponseType type = WorkerResponseType::Initialized;

  // PathResult; path is empty when the goal is unreachable.
  std::uint64_t request_id = 0;
  std::optional<Path> path;
  Point start;
  Point end;

  // TileUpdated
  int x = 0;
  int y = 0;
  bool walkable = true;

  // Error
  QString message;

  static auto of(WorkerResponseType type) -> WorkerResponse {
    WorkerResponse response;
    response.type = type;
    return response;
  }

  static auto path_result(std::uint64_t request_id, std::optional<Path> path,
                          const Point &start,
                          const Point &end) -> WorkerResponse {
    WorkerResponse response;
    response.type = WorkerResponseType::PathResult;
    response.request_id = request_id;
    response.path = std::move(path);
    response.start = start;
    response.end = end;
    return response;
  }

  static auto tile_updated(int x, int y, bool walkable) -> WorkerResponse {
    WorkerResponse response;
    response.type = WorkerResponseType::TileUpdated;
    response.x = x;
    response.y = y;
    response.walkable = walkable;
    return response;
  }

  static auto error(const QString &message) -> WorkerResponse {
    WorkerResponse response;
    response.type = WorkerResponseType::Error;
    response.message = message;
    return response;
  }
};

} // namespace Sprawl::Systems
