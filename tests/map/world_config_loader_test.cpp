#include "map/world_config.h"
#include "map/world_config_loader.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryFile>
#include <gtest/gtest.h>
#include <memory>

using namespace Sprawl::Map;

class WorldConfigLoaderTest : public ::testing::Test {
protected:
  auto write_temp(const QByteArray &content) -> QString {
    temp_file = std::make_unique<QTemporaryFile>();
    if (!temp_file->open()) {
      return {};
    }
    temp_file->write(content);
    temp_file->flush();
    return temp_file->fileName();
  }

  std::unique_ptr<QTemporaryFile> temp_file;
};

TEST_F(WorldConfigLoaderTest, MissingKeysKeepDefaults) {
  WorldConfig config;
  QString error;
  EXPECT_TRUE(WorldConfigLoader::load_from_json(QJsonObject{}, config, &error));
  EXPECT_EQ(config.grid.width, 64);
  EXPECT_EQ(config.grid.chunk_size, 16);
  EXPECT_EQ(config.max_cache_size, 1000);
  EXPECT_EQ(config.spatial_index.max_objects, 10);
  EXPECT_EQ(config.terrain.random_mode, RandomMode::Seeded);
  EXPECT_EQ(config.variants.variant_count(TileType::Concrete), 3);
}

TEST_F(WorldConfigLoaderTest, LoadsFullConfigFromFile) {
  const QByteArray json = R"({
    "name": "Harbor District",
    "seed": 99,
    "randomMode": "ambient",
    "grid": { "width": 48, "height": 32, "chunkSize": 8 },
    "noise": {
      "height": { "scale": 0.1, "octaves": 3 },
      "urbanDensity": { "persistence": 0.4, "seedOffset": 17 }
    },
    "spatialIndex": { "maxObjects": 6, "maxLevels": 4 },
    "tileCache": { "maxSize": 250 },
    "variants": { "forest": 5, "Solar": 0 }
  })";
  QString const path = write_temp(json);
  ASSERT_FALSE(path.isEmpty());

  WorldConfig config;
  QString error;
  ASSERT_TRUE(WorldConfigLoader::load_from_json_file(path, config, &error))
      << error.toStdString();

  EXPECT_EQ(config.name, QStringLiteral("Harbor District"));
  EXPECT_EQ(config.terrain.seed, 99U);
  EXPECT_EQ(config.terrain.random_mode, RandomMode::Ambient);
  EXPECT_EQ(config.grid.width, 48);
  EXPECT_EQ(config.grid.height, 32);
  EXPECT_EQ(config.grid.chunk_size, 8);
  EXPECT_FLOAT_EQ(config.height_noise.scale, 0.1F);
  EXPECT_EQ(config.height_noise.octaves, 3);
  EXPECT_FLOAT_EQ(config.urban_noise.persistence, 0.4F);
  EXPECT_EQ(config.urban_noise.seed_offset, 17U);
  EXPECT_EQ(config.spatial_index.max_objects, 6);
  EXPECT_EQ(config.spatial_index.max_levels, 4);
  EXPECT_EQ(config.max_cache_size, 250);
  EXPECT_EQ(config.variants.variant_count(TileType::Forest), 5);
  EXPECT_EQ(config.variants.variant_count(TileType::Solar), 0);
}

TEST_F(WorldConfigLoaderTest, UnknownVariantTypesAreSkipped) {
  QJsonObject variants;
  variants["plasma"] = 4;
  variants["grass"] = 6;
  QJsonObject root;
  root["variants"] = variants;

  WorldConfig config;
  EXPECT_TRUE(WorldConfigLoader::load_from_json(root, config));
  EXPECT_EQ(config.variants.variant_count(TileType::Grass), 6);
}

TEST_F(WorldConfigLoaderTest, InvalidSectionsAreReported) {
  WorldConfig config;
  QString error;

  QJsonObject bad_grid;
  bad_grid["grid"] = QJsonObject{{"width", 0}};
  EXPECT_FALSE(WorldConfigLoader::load_from_json(bad_grid, config, &error));
  EXPECT_FALSE(error.isEmpty());

  QJsonObject bad_mode;
  bad_mode["randomMode"] = "chaotic";
  EXPECT_FALSE(WorldConfigLoader::load_from_json(bad_mode, config, &error));
  EXPECT_TRUE(error.contains("chaotic"));
}

TEST_F(WorldConfigLoaderTest, MissingFileAndBadJsonAreReported) {
  WorldConfig config;
  QString error;
  EXPECT_FALSE(WorldConfigLoader::load_from_json_file(
      "/nonexistent/world.json", config, &error));
  EXPECT_TRUE(error.contains("Failed to open"));

  QString const path = write_temp("{ not json");
  ASSERT_FALSE(path.isEmpty());
  EXPECT_FALSE(WorldConfigLoader::load_from_json_file(path, config, &error));
  EXPECT_TRUE(error.contains("JSON parse error"));

  QString const array_path = write_temp("[1, 2, 3]");
  EXPECT_FALSE(
      WorldConfigLoader::load_from_json_file(array_path, config, &error));
}
