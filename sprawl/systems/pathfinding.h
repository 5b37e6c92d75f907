#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace Sprawl::Systems {

struct Point {
  int x = 0;
  int y = 0;

  constexpr Point() = default;
  constexpr Point(int x_, int y_) : x(x_), y(y_) {}

  constexpr auto operator==(const Point &other) const -> bool {
    return x == other.x && y == other.y;
  }
};

using Path = std::vector<Point>;

/**
 * @brief A* search over a flat walkability bitmap.
 *
 * The bitmap is indexed as walkable[y * width + x]; non-zero means walkable.
 * Movement is 8-directional with a cardinal cost of 1.0 and a fixed diagonal
 * cost of 1.4. The heuristic is the octile distance.
 */
class Pathfinding {
public:
  static constexpr double k_cardinal_cost = 1.0;
  static constexpr double k_diagonal_cost = 1.4;

  Pathfinding(int width, int height, std::vector<std::uint8_t> walkable_map);

  [[nodiscard]] auto width() const -> int { return m_width; }
  [[nodiscard]] auto height() const -> int { return m_height; }

  /**
   * @brief Replace the whole bitmap.
   * @return false (and no change) when the size is not width * height.
   */
  auto set_walkable_map(std::vector<std::uint8_t> walkable_map) -> bool;

  /**
   * @brief Change one cell. Out-of-range coordinates are ignored.
   * @return true when the cell was in range.
   */
  auto update_tile(int x, int y, bool walkable) -> bool;

  [[nodiscard]] auto in_bounds(int x, int y) const -> bool {
    return x >= 0 && x < m_width && y >= 0 && y < m_height;
  }
  [[nodiscard]] auto is_walkable(int x, int y) const -> bool;

  [[nodiscard]] auto walkable_map() const -> const std::vector<std::uint8_t> & {
    return m_walkable;
  }

  /**
   * @brief Find a path from start to end, both inclusive.
   * @return std::nullopt when either endpoint is out of bounds or blocked, or
   *         when the goal cannot be reached.
   */
  auto find_path(const Point &start,
                 const Point &end) -> std::optional<Path>;

  /**
   * @brief Closest walkable cell on growing square rings around point.
   * @return point itself when it is walkable or nothing is found.
   */
  [[nodiscard]] auto
  find_nearest_walkable_point(const Point &point,
                              int max_search_radius) const -> Point;

  // Sum of the step costs used by the search.
  static auto path_cost(const Path &path) -> double;
  // Euclidean length; diagonal steps count sqrt(2).
  static auto path_length(const Path &path) -> double;

  static auto heuristic(const Point &a, const Point &b) -> double;

private:
  struct SearchNode {
    int x;
    int y;
    double g;
    double h;
    double f;
    int parent;
  };

  struct Direction {
    int dx;
    int dy;
    double cost;
  };

  static constexpr std::array<Direction, 8> k_directions{{
      {0, -1, k_cardinal_cost},
      {1, -1, k_diagonal_cost},
      {1, 0, k_cardinal_cost},
      {1, 1, k_diagonal_cost},
      {0, 1, k_cardinal_cost},
      {-1, 1, k_diagonal_cost},
      {-1, 0, k_cardinal_cost},
      {-1, -1, k_diagonal_cost},
  }};

  auto toIndex(int x, int y) const -> int { return y * m_width + x; }

  static auto pack_key(int x, int y) -> std::uint64_t {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32) |
           static_cast<std::uint32_t>(y);
  }

  auto reconstruct_path(int end_node) const -> Path;

  int m_width;
  int m_height;
  std::vector<std::uint8_t> m_walkable;

  std::vector<SearchNode> m_nodes;
};

} // namespace Sprawl::Systems
