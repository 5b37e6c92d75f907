#include "map/tile.h"
#include <gtest/gtest.h>

using namespace Sprawl::Map;

class TileTypeTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(TileTypeTest, TileTypeEnumToString) {
  EXPECT_EQ(tile_type_to_qstring(TileType::Water), QStringLiteral("water"));
  EXPECT_EQ(tile_type_to_qstring(TileType::Wetland),
            QStringLiteral("wetland"));
  EXPECT_EQ(tile_type_to_qstring(TileType::Solar), QStringLiteral("solar"));
  EXPECT_EQ(tile_type_to_qstring(TileType::Mountain),
            QStringLiteral("mountain"));
  EXPECT_EQ(tile_type_to_qstring(TileType::Unknown),
            QStringLiteral("unknown"));
  EXPECT_EQ(tile_type_to_string(TileType::Asphalt), "asphalt");
}

TEST_F(TileTypeTest, EveryTypeRoundTripsThroughItsName) {
  for (TileType const type : k_all_tile_types) {
    TileType parsed = TileType::Unknown;
    EXPECT_TRUE(try_parse_tile_type(tile_type_to_qstring(type), parsed));
    EXPECT_EQ(parsed, type);
  }
}

TEST_F(TileTypeTest, TileTypeParsingCaseInsensitive) {
  TileType result;

  EXPECT_TRUE(try_parse_tile_type("CONCRETE", result));
  EXPECT_EQ(result, TileType::Concrete);

  EXPECT_TRUE(try_parse_tile_type("  Forest  ", result));
  EXPECT_EQ(result, TileType::Forest);
}

TEST_F(TileTypeTest, InvalidNamesAreRejected) {
  TileType result = TileType::Grass;
  EXPECT_FALSE(try_parse_tile_type("lava", result));
  EXPECT_FALSE(try_parse_tile_type("", result));
  EXPECT_FALSE(try_parse_tile_type("unknown", result));
  EXPECT_EQ(result, TileType::Grass);

  EXPECT_FALSE(tile_type_from_string("neon").has_value());
  EXPECT_EQ(tile_type_from_string("dirt"), TileType::Dirt);
}

TEST_F(TileTypeTest, WaterAndWetlandBlockMovement) {
  EXPECT_FALSE(is_walkable(TileType::Water));
  EXPECT_FALSE(is_walkable(TileType::Wetland));
  EXPECT_TRUE(is_walkable(TileType::Sand));
  EXPECT_TRUE(is_walkable(TileType::Concrete));
  EXPECT_TRUE(is_walkable(TileType::Mountain));
}

TEST_F(TileTypeTest, TileIdIsStable) {
  EXPECT_EQ(make_tile_id(4, 9), QStringLiteral("tile_4_9"));
  EXPECT_EQ(make_tile_id(4, 9), make_tile_id(4, 9));
  EXPECT_NE(make_tile_id(4, 9), make_tile_id(9, 4));
}
