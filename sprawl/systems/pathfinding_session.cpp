#include "pathfinding_session.h"

#include <QDebug>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

namespace Sprawl::Systems {

auto default_pathfinder_factory() -> PathfinderFactory {
  return [](int width, int height, WalkableMap walkable_map) {
    return std::make_unique<Pathfinding>(width, height,
                                         std::move(walkable_map));
  };
}

PathfindingSession::PathfindingSession(PathfinderFactory factory)
    : m_factory(std::move(factory)) {}

auto PathfindingSession::start() -> std::optional<WorkerResponse> {
  if (!m_factory) {
    return fail(QStringLiteral("no pathfinding algorithm available"));
  }
  return std::nullopt;
}

auto PathfindingSession::handle(const WorkerRequest &request)
    -> std::optional<WorkerResponse> {
  switch (request.type) {
  case WorkerRequestType::Init:
    return on_init(request);
  case WorkerRequestType::FindPath:
    return on_find_path(request);
  case WorkerRequestType::UpdateMap:
    return on_update_map(request);
  case WorkerRequestType::UpdateTile:
    return on_update_tile(request);
  }
  return std::nullopt;
}

auto PathfindingSession::on_init(const WorkerRequest &request)
    -> WorkerResponse {
  if (m_state == State::Failed || !m_factory) {
    return fail(QStringLiteral("pathfinding algorithm is not available"));
  }

  WalkableMap walkable_map = request.walkable_map;
  if (walkable_map.empty()) {
    walkable_map = std::move(m_pendingMap);
  }
  m_pendingMap.clear();

  try {
    auto pathfinder =
        m_factory(request.width, request.height, std::move(walkable_map));
    if (!pathfinder) {
      return fail(QStringLiteral("pathfinding algorithm failed to load"));
    }
    m_pathfinder = std::move(pathfinder);
  } catch (const std::exception &e) {
    return fail(QStringLiteral("pathfinding algorithm failed to load: %1")
                    .arg(QString::fromUtf8(e.what())));
  }

  m_state = State::Ready;
  qDebug() << "PathfindingSession: initialized" << request.width << "x"
           << request.height;
  return WorkerResponse::of(WorkerResponseType::Initialized);
}

auto PathfindingSession::on_find_path(const WorkerRequest &request)
    -> WorkerResponse {
  std::optional<Path> path;
  if (m_state == State::Ready) {
    path = m_pathfinder->find_path(request.start, request.end);
  }
  return WorkerResponse::path_result(request.request_id, std::move(path),
                                     request.start, request.end);
}

auto PathfindingSession::on_update_map(const WorkerRequest &request)
    -> std::optional<WorkerResponse> {
  if (m_state != State::Ready) {
    // Kept for an init that arrives without a map.
    m_pendingMap = request.walkable_map;
    return WorkerResponse::of(WorkerResponseType::MapUpdated);
  }
  if (!m_pathfinder->set_walkable_map(request.walkable_map)) {
    return std::nullopt;
  }
  return WorkerResponse::of(WorkerResponseType::MapUpdated);
}

auto PathfindingSession::on_update_tile(const WorkerRequest &request)
    -> std::optional<WorkerResponse> {
  if (m_state != State::Ready ||
      !m_pathfinder->update_tile(request.x, request.y, request.walkable)) {
    qDebug() << "PathfindingSession: ignored tile update at" << request.x
             << request.y;
    return std::nullopt;
  }
  return WorkerResponse::tile_updated(request.x, request.y, request.walkable);
}

auto PathfindingSession::fail(const QString &message) -> WorkerResponse {
  m_state = State::Failed;
  m_pathfinder.reset();
  qWarning() << "PathfindingSession:" << message;
  return WorkerResponse::error(message);
}

} // namespace Sprawl::Systems
