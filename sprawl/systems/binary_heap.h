#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace Sprawl::Systems {

/**
 * @brief Binary min-heap ordered by a caller supplied score function.
 *
 * Elements are compared only through the score function; equality is used
 * solely to locate an element for rescore(). Ties are broken by heap order.
 *
 * rescore() finds the element with a linear scan, so it costs O(n). This is
 * fine for the grid sizes the pathfinder runs on; a position index would be
 * needed to make it O(log n) for much larger searches.
 */
template <typename T> class BinaryHeap {
public:
  using ScoreFunction = std::function<double(const T &)>;

  explicit BinaryHeap(ScoreFunction score) : m_score(std::move(score)) {}

  void push(T item) {
    m_content.push_back(std::move(item));
    bubble_up(m_content.size() - 1);
  }

  /**
   * @brief Remove and return the element with the lowest score.
   * @return std::nullopt when the heap is empty.
   */
  auto pop() -> std::optional<T> {
    if (m_content.empty()) {
      return std::nullopt;
    }
    T top = std::move(m_content.front());
    T last = std::move(m_content.back());
    m_content.pop_back();
    if (!m_content.empty()) {
      m_content.front() = std::move(last);
      sink_down(0);
    }
    return top;
  }

  /**
   * @brief Restore heap order after the score of a queued element changed.
   * @return false if the element is not in the heap.
   */
  auto rescore(const T &item) -> bool {
    auto it = std::find(m_content.begin(), m_content.end(), item);
    if (it == m_content.end()) {
      return false;
    }
    auto const index = static_cast<std::size_t>(it - m_content.begin());
    bubble_up(index);
    sink_down(index);
    return true;
  }

  [[nodiscard]] auto contains(const T &item) const -> bool {
    return std::find(m_content.begin(), m_content.end(), item) !=
           m_content.end();
  }

  [[nodiscard]] auto size() const -> std::size_t { return m_content.size(); }
  [[nodiscard]] auto empty() const -> bool { return m_content.empty(); }

  void clear() { m_content.clear(); }

  void reserve(std::size_t capacity) { m_content.reserve(capacity); }

private:
  void bubble_up(std::size_t index) {
    double const score = m_score(m_content[index]);
    while (index > 0) {
      std::size_t const parent = (index - 1) / 2;
      if (m_score(m_content[parent]) <= score) {
        break;
      }
      std::swap(m_content[parent], m_content[index]);
      index = parent;
    }
  }

  void sink_down(std::size_t index) {
    const std::size_t size = m_content.size();
    double const score = m_score(m_content[index]);
    while (true) {
      std::size_t const left = index * 2 + 1;
      std::size_t const right = left + 1;
      std::size_t smallest = index;
      double smallest_score = score;

      if (left < size) {
        double const left_score = m_score(m_content[left]);
        if (left_score < smallest_score) {
          smallest = left;
          smallest_score = left_score;
        }
      }
      if (right < size && m_score(m_content[right]) < smallest_score) {
        smallest = right;
      }
      if (smallest == index) {
        break;
      }
      std::swap(m_content[index], m_content[smallest]);
      index = smallest;
    }
  }

  std::vector<T> m_content;
  ScoreFunction m_score;
};

} // namespace Sprawl::Systems
