#include "spatial_index.h"

#include <QDebug>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace Sprawl::Map {

QuadTree::QuadTree(const Rect &bounds, int max_objects, int max_levels,
                   int level)
    : m_bounds(bounds), m_max_objects(max_objects), m_max_levels(max_levels),
      m_level(level) {}

void QuadTree::split() {
  double const sub_width = m_bounds.width / 2.0;
  double const sub_height = m_bounds.height / 2.0;
  double const x = m_bounds.x;
  double const y = m_bounds.y;
  int const next_level = m_level + 1;

  // Quadrant order: top-right, top-left, bottom-left, bottom-right.
  m_nodes[0] = std::make_unique<QuadTree>(
      Rect{x + sub_width, y, sub_width, sub_height}, m_max_objects,
      m_max_levels, next_level);
  m_nodes[1] = std::make_unique<QuadTree>(Rect{x, y, sub_width, sub_height},
                                          m_max_objects, m_max_levels,
                                          next_level);
  m_nodes[2] = std::make_unique<QuadTree>(
      Rect{x, y + sub_height, sub_width, sub_height}, m_max_objects,
      m_max_levels, next_level);
  m_nodes[3] = std::make_unique<QuadTree>(
      Rect{x + sub_width, y + sub_height, sub_width, sub_height},
      m_max_objects, m_max_levels, next_level);
}

auto QuadTree::get_index(const Rect &rect) const -> int {
  double const vertical_midpoint = m_bounds.x + (m_bounds.width / 2.0);
  double const horizontal_midpoint = m_bounds.y + (m_bounds.height / 2.0);

  bool const top_quadrant = rect.y < horizontal_midpoint &&
                            rect.y + rect.height < horizontal_midpoint;
  bool const bottom_quadrant = rect.y > horizontal_midpoint;

  if (rect.x < vertical_midpoint &&
      rect.x + rect.width < vertical_midpoint) {
    if (top_quadrant) {
      return 1;
    }
    if (bottom_quadrant) {
      return 2;
    }
  } else if (rect.x > vertical_midpoint) {
    if (top_quadrant) {
      return 0;
    }
    if (bottom_quadrant) {
      return 3;
    }
  }

  return -1;
}

void QuadTree::insert(TilePtr tile) {
  Rect const rect = tile_bounds(*tile);

  if (is_split()) {
    int const index = get_index(rect);
    if (index != -1) {
      m_nodes[static_cast<std::size_t>(index)]->insert(std::move(tile));
      return;
    }
  }

  m_objects.push_back(Entry{rect, std::move(tile)});

  if (static_cast<int>(m_objects.size()) <= m_max_objects ||
      m_level >= m_max_levels) {
    return;
  }

  if (!is_split()) {
    split();
  }

  std::size_t i = 0;
  while (i < m_objects.size()) {
    int const index = get_index(m_objects[i].bounds);
    if (index == -1) {
      ++i;
      continue;
    }
    TilePtr data = std::move(m_objects[i].data);
    m_objects.erase(m_objects.begin() + static_cast<std::ptrdiff_t>(i));
    m_nodes[static_cast<std::size_t>(index)]->insert(std::move(data));
  }
}

void QuadTree::query(const Rect &range, std::vector<TilePtr> &found) const {
  if (!m_bounds.intersects(range)) {
    return;
  }

  for (const auto &object : m_objects) {
    if (range.intersects(object.bounds)) {
      found.push_back(object.data);
    }
  }

  if (is_split()) {
    for (const auto &node : m_nodes) {
      node->query(range, found);
    }
  }
}

auto QuadTree::total_count() const -> std::size_t {
  std::size_t count = m_objects.size();
  if (is_split()) {
    for (const auto &node : m_nodes) {
      count += node->total_count();
    }
  }
  return count;
}

auto QuadTree::depth() const -> int {
  int deepest = m_level;
  if (is_split()) {
    for (const auto &node : m_nodes) {
      deepest = std::max(deepest, node->depth());
    }
  }
  return deepest;
}

auto QuadTree::check_invariants() const -> bool {
  for (const auto &object : m_objects) {
    if (!m_bounds.intersects(object.bounds)) {
      return false;
    }
  }
  if (is_split()) {
    for (const auto &node : m_nodes) {
      if (!node->check_invariants()) {
        return false;
      }
    }
  }
  return true;
}

SpatialIndex::SpatialIndex(int world_width, int world_height, int max_objects,
                           int max_levels)
    : m_world{0.0, 0.0, static_cast<double>(world_width),
              static_cast<double>(world_height)},
      m_max_objects(max_objects), m_max_levels(max_levels),
      m_root(std::make_unique<QuadTree>(m_world, max_objects, max_levels)) {}

auto SpatialIndex::insert(const TilePtr &tile) -> bool {
  if (!tile) {
    qWarning() << "SpatialIndex: attempted to insert a null tile";
    return false;
  }
  if (tile->type == TileType::Unknown) {
    qWarning() << "SpatialIndex: attempted to insert tile" << tile->id
               << "without a type";
    return false;
  }
  if (tile->x < 0 || tile->y < 0 ||
      static_cast<double>(tile->x) >= m_world.width ||
      static_cast<double>(tile->y) >= m_world.height) {
    qWarning() << "SpatialIndex: tile" << tile->id << "at" << tile->x
               << tile->y << "lies outside the world";
    return false;
  }
  m_root->insert(tile);
  ++m_size;
  return true;
}

auto SpatialIndex::query(const Rect &range) const -> std::vector<TilePtr> {
  std::vector<TilePtr> found;
  m_root->query(range, found);
  return found;
}

void SpatialIndex::clear() {
  m_root = std::make_unique<QuadTree>(m_world, m_max_objects, m_max_levels);
  m_size = 0;
}

} // namespace Sprawl::Map
