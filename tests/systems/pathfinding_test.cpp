#include "systems/pathfinding.h"
#include <cmath>
#include <gtest/gtest.h>
#include <memory>
#include <numbers>
#include <vector>

using namespace Sprawl::Systems;

namespace {

auto open_grid(int width, int height) -> std::vector<std::uint8_t> {
  return std::vector<std::uint8_t>(static_cast<std::size_t>(width * height),
                                   1);
}

auto is_connected(const Path &path) -> bool {
  for (std::size_t i = 1; i < path.size(); ++i) {
    int const dx = std::abs(path[i].x - path[i - 1].x);
    int const dy = std::abs(path[i].y - path[i - 1].y);
    if (dx > 1 || dy > 1 || (dx == 0 && dy == 0)) {
      return false;
    }
  }
  return true;
}

} // namespace

class PathfindingTest : public ::testing::Test {
protected:
  void SetUp() override {
    pathfinder = std::make_unique<Pathfinding>(10, 10, open_grid(10, 10));
  }

  void TearDown() override { pathfinder.reset(); }

  void block(int x, int y) { pathfinder->update_tile(x, y, false); }

  std::unique_ptr<Pathfinding> pathfinder;
};

TEST_F(PathfindingTest, StraightLineOnOpenGrid) {
  auto path = pathfinder->find_path({0, 0}, {3, 0});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->front(), Point(0, 0));
  EXPECT_EQ(path->back(), Point(3, 0));
  EXPECT_EQ(path->size(), 4U);
  EXPECT_DOUBLE_EQ(Pathfinding::path_length(*path), 3.0);
  EXPECT_DOUBLE_EQ(Pathfinding::path_cost(*path), 3.0);
}

TEST_F(PathfindingTest, DiagonalOnOpenGrid) {
  auto path = pathfinder->find_path({0, 0}, {2, 2});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->size(), 3U);
  EXPECT_NEAR(Pathfinding::path_length(*path), 2.0 * std::numbers::sqrt2,
              1e-9);
  EXPECT_NEAR(Pathfinding::path_cost(*path), 2.8, 1e-9);
}

TEST_F(PathfindingTest, SamePointReturnsSingleCell) {
  auto path = pathfinder->find_path({5, 5}, {5, 5});
  ASSERT_TRUE(path.has_value());
  ASSERT_EQ(path->size(), 1U);
  EXPECT_EQ(path->front(), Point(5, 5));
}

TEST_F(PathfindingTest, WalledInGoalHasNoPath) {
  for (int dy = -1; dy <= 1; ++dy) {
    for (int dx = -1; dx <= 1; ++dx) {
      if (dx != 0 || dy != 0) {
        block(7 + dx, 7 + dy);
      }
    }
  }
  EXPECT_FALSE(pathfinder->find_path({0, 0}, {7, 7}).has_value());
}

TEST_F(PathfindingTest, BlockedOrOutOfBoundsEndpointsHaveNoPath) {
  block(4, 4);
  EXPECT_FALSE(pathfinder->find_path({4, 4}, {0, 0}).has_value());
  EXPECT_FALSE(pathfinder->find_path({0, 0}, {4, 4}).has_value());
  EXPECT_FALSE(pathfinder->find_path({-1, 0}, {3, 3}).has_value());
  EXPECT_FALSE(pathfinder->find_path({0, 0}, {10, 3}).has_value());
}

TEST_F(PathfindingTest, RoutesAroundWall) {
  for (int y = 0; y < 9; ++y) {
    block(5, y);
  }
  auto path = pathfinder->find_path({0, 0}, {9, 0});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->front(), Point(0, 0));
  EXPECT_EQ(path->back(), Point(9, 0));
  EXPECT_TRUE(is_connected(*path));
  for (const auto &point : *path) {
    EXPECT_TRUE(pathfinder->is_walkable(point.x, point.y));
  }
  bool crossed_gap = false;
  for (const auto &point : *path) {
    crossed_gap = crossed_gap || (point.x == 5 && point.y == 9);
  }
  EXPECT_TRUE(crossed_gap);
}

TEST_F(PathfindingTest, UpdateTileOutOfRangeIsIgnored) {
  EXPECT_FALSE(pathfinder->update_tile(-1, 0, false));
  EXPECT_FALSE(pathfinder->update_tile(0, 10, false));
  EXPECT_TRUE(pathfinder->update_tile(2, 3, false));
  EXPECT_FALSE(pathfinder->is_walkable(2, 3));
}

TEST_F(PathfindingTest, WronglySizedMapIsRejected) {
  EXPECT_FALSE(pathfinder->set_walkable_map(open_grid(3, 3)));
  EXPECT_EQ(pathfinder->walkable_map().size(), 100U);

  std::vector<std::uint8_t> blocked(100, 0);
  EXPECT_TRUE(pathfinder->set_walkable_map(blocked));
  EXPECT_FALSE(pathfinder->is_walkable(0, 0));
}

TEST_F(PathfindingTest, ShortMapIsPaddedAsBlocked) {
  Pathfinding small(4, 4, std::vector<std::uint8_t>(10, 1));
  EXPECT_EQ(small.walkable_map().size(), 16U);
  EXPECT_TRUE(small.is_walkable(1, 2));
  EXPECT_FALSE(small.is_walkable(3, 3));
}

TEST_F(PathfindingTest, NearestWalkablePoint) {
  block(3, 3);
  EXPECT_EQ(pathfinder->find_nearest_walkable_point({2, 2}, 3), Point(2, 2));
  Point const nearest = pathfinder->find_nearest_walkable_point({3, 3}, 3);
  EXPECT_TRUE(pathfinder->is_walkable(nearest.x, nearest.y));
  EXPECT_LE(std::abs(nearest.x - 3), 1);
  EXPECT_LE(std::abs(nearest.y - 3), 1);
}

TEST_F(PathfindingTest, OctileHeuristic) {
  EXPECT_DOUBLE_EQ(Pathfinding::heuristic({0, 0}, {3, 0}), 3.0);
  EXPECT_NEAR(Pathfinding::heuristic({0, 0}, {3, 5}),
              3.0 * std::numbers::sqrt2 + 2.0, 1e-9);
}
