#pragma once

#include "tile.h"
#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace Sprawl::Map {

struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  /**
   * @brief Axis-aligned overlap test. Touching edges count as overlapping.
   */
  [[nodiscard]] auto intersects(const Rect &other) const -> bool {
    return !(other.x > x + width || other.x + other.width < x ||
             other.y > y + height || other.y + other.height < y);
  }
};

/**
 * @brief Region quadtree over unit tile rectangles.
 *
 * A node keeps up to max_objects entries. When it overflows and its level is
 * below max_levels it splits into four equal quadrants and moves every entry
 * that fits entirely inside one quadrant down; entries straddling a midline
 * stay at the parent.
 */
class QuadTree {
public:
  explicit QuadTree(const Rect &bounds, int max_objects = 10,
                    int max_levels = 5, int level = 0);

  void insert(TilePtr tile);

  /**
   * @brief Append every tile whose rectangle intersects range.
   */
  void query(const Rect &range, std::vector<TilePtr> &found) const;

  [[nodiscard]] auto bounds() const -> const Rect & { return m_bounds; }
  [[nodiscard]] auto level() const -> int { return m_level; }
  [[nodiscard]] auto is_split() const -> bool { return m_nodes[0] != nullptr; }
  [[nodiscard]] auto local_count() const -> std::size_t {
    return m_objects.size();
  }
  [[nodiscard]] auto child(int index) const -> const QuadTree * {
    return m_nodes[static_cast<std::size_t>(index)].get();
  }

  [[nodiscard]] auto total_count() const -> std::size_t;
  [[nodiscard]] auto depth() const -> int;

  // True when every stored rectangle intersects the node holding it.
  [[nodiscard]] auto check_invariants() const -> bool;

  static auto tile_bounds(const Tile &tile) -> Rect {
    return Rect{static_cast<double>(tile.x), static_cast<double>(tile.y), 1.0,
                1.0};
  }

private:
  struct Entry {
    Rect bounds;
    TilePtr data;
  };

  void split();
  [[nodiscard]] auto get_index(const Rect &rect) const -> int;

  Rect m_bounds;
  int m_max_objects;
  int m_max_levels;
  int m_level;
  std::vector<Entry> m_objects;
  std::array<std::unique_ptr<QuadTree>, 4> m_nodes;
};

/**
 * @brief Tile index for viewport and minimap range queries.
 *
 * The index is rebuilt rather than edited: call clear() and insert the new
 * tile set when the world changes.
 */
class SpatialIndex {
public:
  SpatialIndex(int world_width, int world_height, int max_objects = 10,
               int max_levels = 5);

  /**
   * @brief Insert a tile.
   * @return false (tile logged and skipped) for a null tile, a tile without
   *         a type, or a tile outside the world bounds.
   */
  auto insert(const TilePtr &tile) -> bool;

  [[nodiscard]] auto query(const Rect &range) const -> std::vector<TilePtr>;

  void clear();

  [[nodiscard]] auto size() const -> std::size_t { return m_size; }
  [[nodiscard]] auto root() const -> const QuadTree & { return *m_root; }

private:
  Rect m_world;
  int m_max_objects;
  int m_max_levels;
  std::unique_ptr<QuadTree> m_root;
  std::size_t m_size = 0;
};

} // namespace Sprawl::Map
