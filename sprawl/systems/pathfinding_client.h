#pragma once

#include "pathfinding_messages.h"
#include "pathfinding_session.h"
#include "pathfinding_worker.h"
#include <QString>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace Sprawl::Systems {

/**
 * @brief Host side of the pathfinding worker.
 *
 * Keeps the host copy of the walkable bitmap, hands out request ids and
 * routes path results back to the callback registered for their id. Results
 * for ids that were forgotten are dropped. Callbacks run on the thread that
 * calls poll().
 */
class PathfindingClient {
public:
  using PathCallback = std::function<void(const WorkerResponse &)>;
  using ErrorCallback = std::function<void(const QString &)>;

  explicit PathfindingClient(
      PathfinderFactory factory = default_pathfinder_factory());

  void init(int width, int height, WalkableMap walkable_map);

  auto request_path(const Point &start, const Point &end,
                    PathCallback callback) -> std::uint64_t;

  void update_map(WalkableMap walkable_map);
  void update_tile(int x, int y, bool walkable);

  // The worker still finishes the search; its result is ignored.
  void forget_request(std::uint64_t request_id);

  // Dispatches queued responses; returns how many were handled.
  auto poll() -> std::size_t;
  auto poll_for(std::chrono::milliseconds timeout) -> std::size_t;

  // Recreates the worker and replays init with the host copy of the map.
  void restart();

  void set_error_callback(ErrorCallback callback) {
    m_errorCallback = std::move(callback);
  }

  [[nodiscard]] auto is_ready() const -> bool { return m_ready; }
  [[nodiscard]] auto has_failed() const -> bool { return m_failed; }
  [[nodiscard]] auto last_error() const -> const QString & {
    return m_lastError;
  }
  [[nodiscard]] auto pending_count() const -> std::size_t {
    return m_callbacks.size();
  }
  [[nodiscard]] auto walkable_map() const -> const WalkableMap & {
    return m_walkableMap;
  }

private:
  auto dispatch(std::vector<WorkerResponse> responses) -> std::size_t;

  PathfinderFactory m_factory;
  std::unique_ptr<PathfindingWorker> m_worker;

  int m_width = 0;
  int m_height = 0;
  WalkableMap m_walkableMap;
  bool m_initSent = false;

  std::uint64_t m_nextRequestId = 1;
  std::unordered_map<std::uint64_t, PathCallback> m_callbacks;

  ErrorCallback m_errorCallback;
  bool m_ready = false;
  bool m_failed = false;
  QString m_lastError;
};

} // namespace Sprawl::Systems
