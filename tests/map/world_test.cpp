#include "map/world.h"
#include "map/world_config.h"
#include "map/world_generator.h"
#include <gtest/gtest.h>
#include <memory>

using namespace Sprawl::Map;

namespace {

auto small_config(int width, int height) -> WorldConfig {
  WorldConfig config;
  config.grid.width = width;
  config.grid.height = height;
  config.grid.chunk_size = 8;
  config.terrain.seed = 2024U;
  return config;
}

} // namespace

class WorldTest : public ::testing::Test {
protected:
  void SetUp() override { world = std::make_unique<World>(small_config(20, 20)); }

  void TearDown() override { world.reset(); }

  std::unique_ptr<World> world;
};

TEST_F(WorldTest, TileAtReturnsCachedTile) {
  auto first = world->tile_at(3, 4);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->x, 3);
  EXPECT_EQ(first->y, 4);
  EXPECT_EQ(first->id, QStringLiteral("tile_3_4"));
  EXPECT_NE(first->type, TileType::Unknown);

  auto again = world->tile_at(3, 4);
  EXPECT_EQ(first.get(), again.get());
  EXPECT_EQ(world->cache_size(), 1U);
}

TEST_F(WorldTest, OutOfBoundsHasNoTile) {
  EXPECT_EQ(world->tile_at(-1, 0), nullptr);
  EXPECT_EQ(world->tile_at(0, 20), nullptr);
  EXPECT_EQ(world->cache_size(), 0U);
}

TEST_F(WorldTest, ChunkCoversChunkSquare) {
  auto chunk = world->generate_chunk(1, 0);
  ASSERT_EQ(chunk.size(), 64U);
  EXPECT_EQ(chunk.front()->x, 8);
  EXPECT_EQ(chunk.front()->y, 0);
  EXPECT_EQ(chunk.back()->x, 15);
  EXPECT_EQ(chunk.back()->y, 7);
}

TEST_F(WorldTest, EdgeChunkSkipsCellsOutsideWorld) {
  auto chunk = world->generate_chunk(2, 2);
  EXPECT_EQ(chunk.size(), 16U);
  for (const auto &tile : chunk) {
    EXPECT_TRUE(world->in_bounds(tile->x, tile->y));
  }
}

TEST_F(WorldTest, ClearCacheRegeneratesSameSeededTile) {
  auto before = world->tile_at(5, 5);
  world->clear_cache();
  EXPECT_EQ(world->cache_size(), 0U);
  auto after = world->tile_at(5, 5);
  EXPECT_NE(before.get(), after.get());
  EXPECT_EQ(before->type, after->type);
  EXPECT_EQ(before->variant, after->variant);
  EXPECT_DOUBLE_EQ(before->height, after->height);
}

TEST(WorldCacheTest, OldestTileIsEvictedFirst) {
  WorldConfig config = small_config(10, 10);
  config.max_cache_size = 3;
  World world(config);

  auto first = world.tile_at(0, 0);
  world.tile_at(1, 0);
  world.tile_at(2, 0);
  EXPECT_EQ(world.cache_size(), 3U);

  world.tile_at(3, 0);
  EXPECT_EQ(world.cache_size(), 3U);
  EXPECT_NE(world.tile_at(0, 0).get(), first.get());
}

TEST(WorldGeneratorTest, GeneratesEveryTileInRowMajorOrder) {
  WorldGenerator generator(small_config(12, 9));
  auto const map = generator.generate();
  EXPECT_EQ(map.width(), 12);
  EXPECT_EQ(map.height(), 9);
  ASSERT_EQ(map.tiles().size(), 108U);
  for (int y = 0; y < 9; ++y) {
    for (int x = 0; x < 12; ++x) {
      auto tile = map.tile_at(x, y);
      ASSERT_NE(tile, nullptr);
      EXPECT_EQ(tile->x, x);
      EXPECT_EQ(tile->y, y);
    }
  }
  EXPECT_EQ(map.tile_at(12, 0), nullptr);
}

TEST(WorldGeneratorTest, MatchesOnDemandWorld) {
  WorldConfig const config = small_config(16, 16);
  auto const map = WorldGenerator(config).generate();
  World world(config);
  for (int y = 0; y < 16; y += 3) {
    for (int x = 0; x < 16; x += 3) {
      EXPECT_EQ(map.tile_at(x, y)->type, world.tile_at(x, y)->type);
    }
  }
}

TEST(WorldGeneratorTest, WalkableMapFollowsTileTypes) {
  auto const map = WorldGenerator(small_config(24, 24)).generate();
  auto const walkable = map.walkable_map();
  ASSERT_EQ(walkable.size(), map.tiles().size());
  for (std::size_t i = 0; i < walkable.size(); ++i) {
    EXPECT_EQ(walkable[i] != 0, is_walkable(map.tiles()[i]->type));
  }
}

TEST(WorldGeneratorTest, SpatialIndexHoldsAllTiles) {
  auto const map = WorldGenerator(small_config(24, 24)).generate();
  auto index = map.build_spatial_index();
  EXPECT_EQ(index->size(), 576U);
  EXPECT_EQ(index->query(Rect{0.0, 0.0, 24.0, 24.0}).size(), 576U);

  int total = 0;
  for (const auto &[type, count] : map.count_by_type()) {
    total += count;
  }
  EXPECT_EQ(total, 576);
}
