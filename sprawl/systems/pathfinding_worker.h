#pragma once

#include "pathfinding_messages.h"
#include "pathfinding_session.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Sprawl::Systems {

/**
 * @brief Runs a PathfindingSession on a dedicated thread.
 *
 * Requests are handled strictly in the order they were posted. Responses are
 * queued for the owner to collect; path results carry the request id they
 * answer and may be interleaved with other responses. There is no
 * cancellation: a posted request always runs unless the worker is destroyed
 * first.
 */
class PathfindingWorker {
public:
  explicit PathfindingWorker(
      PathfinderFactory factory = default_pathfinder_factory());
  ~PathfindingWorker();

  PathfindingWorker(const PathfindingWorker &) = delete;
  auto operator=(const PathfindingWorker &) -> PathfindingWorker & = delete;

  void post(WorkerRequest request);

  auto fetch_responses() -> std::vector<WorkerResponse>;

  // Blocks until at least one response is queued or the timeout expires.
  auto wait_for_responses(std::chrono::milliseconds timeout)
      -> std::vector<WorkerResponse>;

  [[nodiscard]] auto pending_requests() const -> std::size_t;

private:
  void worker_loop();
  void push_response(WorkerResponse response);

  PathfindingSession m_session;

  std::atomic<bool> m_stopWorker{false};
  mutable std::mutex m_requestMutex;
  std::condition_variable m_requestCondition;
  std::queue<WorkerRequest> m_requestQueue;

  std::mutex m_responseMutex;
  std::condition_variable m_responseCondition;
  std::queue<WorkerResponse> m_responseQueue;

  std::thread m_workerThread;
};

} // namespace Sprawl::Systems
