#include "pathfinding_worker.h"

#include <chrono>
#include <mutex>
#include <utility>
#include <vector>

namespace Sprawl::Systems {

PathfindingWorker::PathfindingWorker(PathfinderFactory factory)
    : m_session(std::move(factory)) {
  m_workerThread = std::thread(&PathfindingWorker::worker_loop, this);
}

PathfindingWorker::~PathfindingWorker() {
  {
    std::lock_guard<std::mutex> const lock(m_requestMutex);
    m_stopWorker.store(true, std::memory_order_release);
  }
  m_requestCondition.notify_all();
  if (m_workerThread.joinable()) {
    m_workerThread.join();
  }
}

void PathfindingWorker::post(WorkerRequest request) {
  {
    std::lock_guard<std::mutex> const lock(m_requestMutex);
    m_requestQueue.push(std::move(request));
  }
  m_requestCondition.notify_one();
}

auto PathfindingWorker::fetch_responses() -> std::vector<WorkerResponse> {
  std::vector<WorkerResponse> responses;
  std::lock_guard<std::mutex> const lock(m_responseMutex);
  while (!m_responseQueue.empty()) {
    responses.push_back(std::move(m_responseQueue.front()));
    m_responseQueue.pop();
  }
  return responses;
}

auto PathfindingWorker::wait_for_responses(std::chrono::milliseconds timeout)
    -> std::vector<WorkerResponse> {
  {
    std::unique_lock<std::mutex> lock(m_responseMutex);
    m_responseCondition.wait_for(
        lock, timeout, [this]() { return !m_responseQueue.empty(); });
  }
  return fetch_responses();
}

auto PathfindingWorker::pending_requests() const -> std::size_t {
  std::lock_guard<std::mutex> const lock(m_requestMutex);
  return m_requestQueue.size();
}

void PathfindingWorker::push_response(WorkerResponse response) {
  {
    std::lock_guard<std::mutex> const lock(m_responseMutex);
    m_responseQueue.push(std::move(response));
  }
  m_responseCondition.notify_all();
}

void PathfindingWorker::worker_loop() {
  if (auto startup_error = m_session.start()) {
    push_response(std::move(*startup_error));
  }

  while (true) {
    WorkerRequest request;
    {
      std::unique_lock<std::mutex> lock(m_requestMutex);
      m_requestCondition.wait(lock, [this]() {
        return m_stopWorker.load(std::memory_order_acquire) ||
               !m_requestQueue.empty();
      });

      if (m_stopWorker.load(std::memory_order_acquire)) {
        break;
      }

      request = std::move(m_requestQueue.front());
      m_requestQueue.pop();
    }

    if (auto response = m_session.handle(request)) {
      push_response(std::move(*response));
    }
  }
}

} // namespace Sprawl::Systems
