#include "pathfinding.h"
#include "binary_heap.h"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Sprawl::Systems {

Pathfinding::Pathfinding(int width, int height,
                         std::vector<std::uint8_t> walkable_map)
    : m_width(std::max(width, 0)), m_height(std::max(height, 0)),
      m_walkable(std::move(walkable_map)) {
  const auto total_cells =
      static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height);
  if (m_walkable.size() != total_cells) {
    qWarning() << "Pathfinding: walkable map has" << m_walkable.size()
               << "cells, expected" << total_cells
               << "- missing cells are blocked";
    m_walkable.resize(total_cells, 0);
  }
}

auto Pathfinding::set_walkable_map(std::vector<std::uint8_t> walkable_map)
    -> bool {
  const auto total_cells =
      static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height);
  if (walkable_map.size() != total_cells) {
    qWarning() << "Pathfinding: rejected walkable map with"
               << walkable_map.size() << "cells, expected" << total_cells;
    return false;
  }
  m_walkable = std::move(walkable_map);
  return true;
}

auto Pathfinding::update_tile(int x, int y, bool walkable) -> bool {
  if (!in_bounds(x, y)) {
    return false;
  }
  m_walkable[static_cast<std::size_t>(toIndex(x, y))] =
      static_cast<std::uint8_t>(walkable ? 1 : 0);
  return true;
}

auto Pathfinding::is_walkable(int x, int y) const -> bool {
  if (!in_bounds(x, y)) {
    return false;
  }
  return m_walkable[static_cast<std::size_t>(toIndex(x, y))] != 0;
}

auto Pathfinding::find_path(const Point &start,
                            const Point &end) -> std::optional<Path> {
  if (!is_walkable(start.x, start.y) || !is_walkable(end.x, end.y)) {
    return std::nullopt;
  }

  if (start == end) {
    return Path{start};
  }

  m_nodes.clear();

  BinaryHeap<int> open_set(
      [this](const int &node) { return m_nodes[static_cast<std::size_t>(node)].f; });
  std::unordered_map<std::uint64_t, int> open_nodes;
  std::unordered_set<std::uint64_t> closed_set;

  const double start_h = heuristic(start, end);
  m_nodes.push_back({start.x, start.y, 0.0, start_h, start_h, -1});
  open_set.push(0);
  open_nodes.emplace(pack_key(start.x, start.y), 0);

  while (auto popped = open_set.pop()) {
    const int current_idx = *popped;
    const SearchNode current = m_nodes[static_cast<std::size_t>(current_idx)];

    if (current.x == end.x && current.y == end.y) {
      return reconstruct_path(current_idx);
    }

    const std::uint64_t current_key = pack_key(current.x, current.y);
    open_nodes.erase(current_key);
    closed_set.insert(current_key);

    for (const auto &dir : k_directions) {
      const int nx = current.x + dir.dx;
      const int ny = current.y + dir.dy;

      if (!is_walkable(nx, ny)) {
        continue;
      }

      const std::uint64_t neighbor_key = pack_key(nx, ny);
      if (closed_set.contains(neighbor_key)) {
        continue;
      }

      const double g_score = current.g + dir.cost;

      auto open_it = open_nodes.find(neighbor_key);
      if (open_it == open_nodes.end()) {
        const double h = heuristic(Point{nx, ny}, end);
        const int node_idx = static_cast<int>(m_nodes.size());
        m_nodes.push_back({nx, ny, g_score, h, g_score + h, current_idx});
        open_nodes.emplace(neighbor_key, node_idx);
        open_set.push(node_idx);
        continue;
      }

      SearchNode &neighbor = m_nodes[static_cast<std::size_t>(open_it->second)];
      if (g_score < neighbor.g) {
        neighbor.g = g_score;
        neighbor.f = g_score + neighbor.h;
        neighbor.parent = current_idx;
        open_set.rescore(open_it->second);
      }
    }
  }

  return std::nullopt;
}

auto Pathfinding::reconstruct_path(int end_node) const -> Path {
  Path path;
  int current = end_node;
  while (current >= 0) {
    const SearchNode &node = m_nodes[static_cast<std::size_t>(current)];
    path.emplace_back(node.x, node.y);
    current = node.parent;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

auto Pathfinding::heuristic(const Point &a, const Point &b) -> double {
  const double dx = std::abs(a.x - b.x);
  const double dy = std::abs(a.y - b.y);
  return (dx + dy) + (std::numbers::sqrt2 - 2.0) * std::min(dx, dy);
}

auto Pathfinding::path_cost(const Path &path) -> double {
  double cost = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const bool diagonal =
        path[i].x != path[i - 1].x && path[i].y != path[i - 1].y;
    cost += diagonal ? k_diagonal_cost : k_cardinal_cost;
  }
  return cost;
}

auto Pathfinding::path_length(const Path &path) -> double {
  double length = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const double dx = path[i].x - path[i - 1].x;
    const double dy = path[i].y - path[i - 1].y;
    length += std::sqrt(dx * dx + dy * dy);
  }
  return length;
}

auto Pathfinding::find_nearest_walkable_point(const Point &point,
                                              int max_search_radius) const
    -> Point {
  if (is_walkable(point.x, point.y)) {
    return point;
  }

  for (int radius = 1; radius <= max_search_radius; ++radius) {
    for (int dy = -radius; dy <= radius; ++dy) {
      for (int dx = -radius; dx <= radius; ++dx) {
        if (std::abs(dx) != radius && std::abs(dy) != radius) {
          continue;
        }

        int const check_x = point.x + dx;
        int const check_y = point.y + dy;

        if (is_walkable(check_x, check_y)) {
          return {check_x, check_y};
        }
      }
    }
  }

  return point;
}

} // namespace Sprawl::Systems
