#include "pathfinding_client.h"

#include <QDebug>
#include <chrono>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace Sprawl::Systems {

PathfindingClient::PathfindingClient(PathfinderFactory factory)
    : m_factory(std::move(factory)),
      m_worker(std::make_unique<PathfindingWorker>(m_factory)) {}

void PathfindingClient::init(int width, int height,
                             WalkableMap walkable_map) {
  m_width = width;
  m_height = height;
  m_walkableMap = walkable_map;
  m_initSent = true;
  m_ready = false;
  m_worker->post(WorkerRequest::init(width, height, std::move(walkable_map)));
}

auto PathfindingClient::request_path(const Point &start, const Point &end,
                                     PathCallback callback) -> std::uint64_t {
  const std::uint64_t request_id = m_nextRequestId++;
  if (callback) {
    m_callbacks.emplace(request_id, std::move(callback));
  }
  m_worker->post(WorkerRequest::find_path(request_id, start, end));
  return request_id;
}

void PathfindingClient::update_map(WalkableMap walkable_map) {
  auto const expected = static_cast<std::size_t>(m_width) *
                        static_cast<std::size_t>(m_height);
  if (m_initSent && walkable_map.size() != expected) {
    qWarning() << "PathfindingClient: map update has" << walkable_map.size()
               << "cells, expected" << expected;
    return;
  }
  m_walkableMap = walkable_map;
  m_worker->post(WorkerRequest::update_map(std::move(walkable_map)));
}

void PathfindingClient::update_tile(int x, int y, bool walkable) {
  if (x >= 0 && x < m_width && y >= 0 && y < m_height) {
    auto const index = static_cast<std::size_t>(y * m_width + x);
    if (index < m_walkableMap.size()) {
      m_walkableMap[index] = static_cast<std::uint8_t>(walkable ? 1 : 0);
    }
  }
  m_worker->post(WorkerRequest::update_tile(x, y, walkable));
}

void PathfindingClient::forget_request(std::uint64_t request_id) {
  m_callbacks.erase(request_id);
}

auto PathfindingClient::poll() -> std::size_t {
  return dispatch(m_worker->fetch_responses());
}

auto PathfindingClient::poll_for(std::chrono::milliseconds timeout)
    -> std::size_t {
  return dispatch(m_worker->wait_for_responses(timeout));
}

void PathfindingClient::restart() {
  qDebug() << "PathfindingClient: restarting worker,"
           << m_callbacks.size() << "requests dropped";
  m_worker = std::make_unique<PathfindingWorker>(m_factory);
  m_callbacks.clear();
  m_ready = false;
  m_failed = false;
  m_lastError.clear();
  if (m_initSent) {
    m_worker->post(WorkerRequest::init(m_width, m_height, m_walkableMap));
  }
}

auto PathfindingClient::dispatch(std::vector<WorkerResponse> responses)
    -> std::size_t {
  for (auto &response : responses) {
    switch (response.type) {
    case WorkerResponseType::Initialized:
      m_ready = true;
      break;
    case WorkerResponseType::PathResult: {
      auto it = m_callbacks.find(response.request_id);
      if (it == m_callbacks.end()) {
        break;
      }
      PathCallback callback = std::move(it->second);
      m_callbacks.erase(it);
      callback(response);
      break;
    }
    case WorkerResponseType::MapUpdated:
    case WorkerResponseType::TileUpdated:
      break;
    case WorkerResponseType::Error:
      m_ready = false;
      m_failed = true;
      m_lastError = response.message;
      qWarning() << "PathfindingClient: worker error:" << response.message;
      if (m_errorCallback) {
        m_errorCallback(response.message);
      }
      break;
    }
  }
  return responses.size();
}

} // namespace Sprawl::Systems
