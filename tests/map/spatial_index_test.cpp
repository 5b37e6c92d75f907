#include "map/spatial_index.h"
#include "map/tile.h"
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <vector>

using namespace Sprawl::Map;

namespace {

auto make_tile(int x, int y,
               TileType type = TileType::Grass) -> TilePtr {
  auto tile = std::make_shared<Tile>();
  tile->type = type;
  tile->x = x;
  tile->y = y;
  tile->id = make_tile_id(x, y);
  return tile;
}

} // namespace

class SpatialIndexTest : public ::testing::Test {
protected:
  void SetUp() override {
    index = std::make_unique<SpatialIndex>(32, 32, 4, 5);
    for (int y = 0; y < 32; ++y) {
      for (int x = 0; x < 32; ++x) {
        ASSERT_TRUE(index->insert(make_tile(x, y)));
      }
    }
  }

  void TearDown() override { index.reset(); }

  std::unique_ptr<SpatialIndex> index;
};

TEST_F(SpatialIndexTest, FullBoundsQueryReturnsEveryTile) {
  EXPECT_EQ(index->size(), 1024U);
  EXPECT_EQ(index->root().total_count(), 1024U);

  auto found = index->query(Rect{0.0, 0.0, 32.0, 32.0});
  ASSERT_EQ(found.size(), 1024U);

  std::set<QString> ids;
  for (const auto &tile : found) {
    ids.insert(tile->id);
  }
  EXPECT_EQ(ids.size(), 1024U);
}

TEST_F(SpatialIndexTest, DisjointQueryReturnsNothing) {
  EXPECT_TRUE(index->query(Rect{100.0, 100.0, 5.0, 5.0}).empty());
  EXPECT_TRUE(index->query(Rect{-20.0, -20.0, 5.0, 5.0}).empty());
}

TEST_F(SpatialIndexTest, SmallQueryReturnsNearbyTilesOnly) {
  auto found = index->query(Rect{10.0, 10.0, 2.0, 2.0});
  ASSERT_FALSE(found.empty());
  for (const auto &tile : found) {
    EXPECT_GE(tile->x, 9);
    EXPECT_LE(tile->x, 12);
    EXPECT_GE(tile->y, 9);
    EXPECT_LE(tile->y, 12);
  }
  bool has_center = false;
  for (const auto &tile : found) {
    has_center = has_center || (tile->x == 11 && tile->y == 11);
  }
  EXPECT_TRUE(has_center);
}

TEST_F(SpatialIndexTest, TreeSplitsWithinLevelLimit) {
  EXPECT_TRUE(index->root().is_split());
  EXPECT_LE(index->root().depth(), 5);
  EXPECT_TRUE(index->root().check_invariants());
}

TEST_F(SpatialIndexTest, ClearEmptiesIndex) {
  index->clear();
  EXPECT_EQ(index->size(), 0U);
  EXPECT_TRUE(index->query(Rect{0.0, 0.0, 32.0, 32.0}).empty());
  EXPECT_FALSE(index->root().is_split());
}

TEST(SpatialIndexInsertTest, InvalidTilesAreRejected) {
  SpatialIndex index(8, 8);
  EXPECT_FALSE(index.insert(nullptr));
  EXPECT_FALSE(index.insert(make_tile(1, 1, TileType::Unknown)));
  EXPECT_FALSE(index.insert(make_tile(50, 50)));
  EXPECT_EQ(index.size(), 0U);
}

TEST(SpatialIndexInsertTest, TilesJustOutsideWorldEdgesAreRejected) {
  SpatialIndex index(8, 8);
  EXPECT_FALSE(index.insert(make_tile(-1, 0)));
  EXPECT_FALSE(index.insert(make_tile(0, -1)));
  EXPECT_FALSE(index.insert(make_tile(8, 3)));
  EXPECT_FALSE(index.insert(make_tile(3, 8)));
  EXPECT_TRUE(index.insert(make_tile(7, 7)));
  EXPECT_TRUE(index.insert(make_tile(0, 0)));
  EXPECT_EQ(index.size(), 2U);
}

TEST(RectTest, TouchingEdgesIntersect) {
  Rect const a{0.0, 0.0, 1.0, 1.0};
  EXPECT_TRUE(a.intersects(Rect{1.0, 0.0, 1.0, 1.0}));
  EXPECT_TRUE(a.intersects(Rect{0.5, 0.5, 0.1, 0.1}));
  EXPECT_FALSE(a.intersects(Rect{1.5, 0.0, 1.0, 1.0}));
}

TEST(QuadTreeTest, StraddlingEntriesStayAtParent) {
  QuadTree tree(Rect{0.0, 0.0, 8.0, 8.0}, 1, 3);
  tree.insert(make_tile(0, 0));
  tree.insert(make_tile(6, 6));
  tree.insert(make_tile(3, 3));

  ASSERT_TRUE(tree.is_split());
  EXPECT_EQ(tree.local_count(), 1U);
  EXPECT_EQ(tree.total_count(), 3U);
  EXPECT_EQ(tree.child(1)->total_count(), 1U);
  EXPECT_EQ(tree.child(3)->total_count(), 1U);
}
