#pragma once

#include "pathfinding.h"
#include "pathfinding_messages.h"
#include <QString>
#include <functional>
#include <memory>
#include <optional>

namespace Sprawl::Systems {

using PathfinderFactory = std::function<std::unique_ptr<Pathfinding>(
    int width, int height, WalkableMap walkable_map)>;

auto default_pathfinder_factory() -> PathfinderFactory;

/**
 * @brief State of one pathfinding worker: its pathfinder and bitmap.
 *
 * A session starts Uninitialized, becomes Ready on the first init request
 * and goes to Failed when the pathfinder cannot be created. Requests are
 * handled one at a time and produce at most one response each.
 */
class PathfindingSession {
public:
  enum class State { Uninitialized, Ready, Failed };

  explicit PathfindingSession(PathfinderFactory factory);

  /**
   * @brief Check that a pathfinder can be created at all.
   * @return an Error response when the factory is missing.
   */
  auto start() -> std::optional<WorkerResponse>;

  auto handle(const WorkerRequest &request) -> std::optional<WorkerResponse>;

  [[nodiscard]] auto state() const -> State { return m_state; }
  [[nodiscard]] auto pathfinder() const -> const Pathfinding * {
    return m_pathfinder.get();
  }
  [[nodiscard]] auto pending_map() const -> const WalkableMap & {
    return m_pendingMap;
  }

private:
  auto on_init(const WorkerRequest &request) -> WorkerResponse;
  auto on_find_path(const WorkerRequest &request) -> WorkerResponse;
  auto on_update_map(const WorkerRequest &request)
      -> std::optional<WorkerResponse>;
  auto on_update_tile(const WorkerRequest &request)
      -> std::optional<WorkerResponse>;

  auto fail(const QString &message) -> WorkerResponse;

  PathfinderFactory m_factory;
  std::unique_ptr<Pathfinding> m_pathfinder;
  WalkableMap m_pendingMap;
  State m_state = State::Uninitialized;
};

} // namespace Sprawl::Systems
