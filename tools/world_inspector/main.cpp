#include "../../sprawl/core/serialization.h"
#include "../../sprawl/map/spatial_index.h"
#include "../../sprawl/map/tile.h"
#include "../../sprawl/map/world_config.h"
#include "../../sprawl/map/world_config_loader.h"
#include "../../sprawl/map/world_generator.h"
#include "../../sprawl/systems/pathfinding_client.h"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using Sprawl::Map::TileType;

auto tile_glyph(TileType type) -> char {
  switch (type) {
  case TileType::Water:
    return '~';
  case TileType::Sand:
    return '.';
  case TileType::Wetland:
    return ',';
  case TileType::Concrete:
    return '#';
  case TileType::Asphalt:
    return '=';
  case TileType::Metal:
    return 'M';
  case TileType::Tiles:
    return '+';
  case TileType::Solar:
    return 'S';
  case TileType::Garden:
    return 'g';
  case TileType::Grass:
    return '"';
  case TileType::Dirt:
    return ':';
  case TileType::Forest:
    return 'T';
  case TileType::Mountain:
    return '^';
  case TileType::Unknown:
    break;
  }
  return '?';
}

// Parses "a,b,c,d" into four integers.
auto parse_quad(const QString &value) -> std::optional<std::vector<int>> {
  const QStringList parts = value.split(',');
  if (parts.size() != 4) {
    return std::nullopt;
  }
  std::vector<int> numbers;
  for (const auto &part : parts) {
    bool ok = false;
    int const number = part.trimmed().toInt(&ok);
    if (!ok) {
      return std::nullopt;
    }
    numbers.push_back(number);
  }
  return numbers;
}

void print_map(const Sprawl::Map::WorldMap &map,
               const std::set<std::pair<int, int>> &path_cells) {
  for (int y = 0; y < map.height(); ++y) {
    std::string row;
    row.reserve(static_cast<std::size_t>(map.width()));
    for (int x = 0; x < map.width(); ++x) {
      if (path_cells.count({x, y}) != 0) {
        row.push_back('*');
        continue;
      }
      auto tile = map.tile_at(x, y);
      row.push_back(tile ? tile_glyph(tile->type) : ' ');
    }
    std::cout << row << std::endl;
  }
}

void print_stats(const Sprawl::Map::WorldMap &map) {
  int const total = map.width() * map.height();
  std::cout << "\nTile statistics (" << total << " tiles)" << std::endl;
  for (const auto &[type, count] : map.count_by_type()) {
    double const share = total > 0 ? 100.0 * count / total : 0.0;
    std::cout << "  " << tile_glyph(type) << ' ' << std::left << std::setw(10)
              << Sprawl::Map::tile_type_to_string(type) << std::right
              << std::setw(6) << count << "  " << std::fixed
              << std::setprecision(1) << share << '%' << std::endl;
  }
}

auto run_path_request(const Sprawl::Map::WorldMap &map,
                      const std::vector<int> &coords)
    -> std::optional<Sprawl::Systems::Path> {
  using namespace Sprawl::Systems;

  PathfindingClient client;
  client.set_error_callback([](const QString &message) {
    std::cerr << "[ERROR] pathfinding worker: " << message.toStdString()
              << std::endl;
  });
  client.init(map.width(), map.height(), map.walkable_map());

  bool done = false;
  std::optional<Path> result;
  client.request_path(Point{coords[0], coords[1]}, Point{coords[2], coords[3]},
                      [&](const WorkerResponse &response) {
                        done = true;
                        result = response.path;
                      });

  auto const deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!done && !client.has_failed() &&
         std::chrono::steady_clock::now() < deadline) {
    client.poll_for(std::chrono::milliseconds(50));
  }
  if (!done) {
    std::cerr << "[ERROR] path request did not complete" << std::endl;
  }
  return result;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("world_inspector");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Generates a Neon Sprawl world and prints it as ASCII.");
  parser.addHelpOption();

  QCommandLineOption config_option("config", "World config JSON file.",
                                   "file");
  QCommandLineOption seed_option("seed", "World seed.", "seed");
  QCommandLineOption width_option("width", "World width in tiles.", "width");
  QCommandLineOption height_option("height", "World height in tiles.",
                                   "height");
  QCommandLineOption path_option(
      "path", "Find a path between two cells through the worker.",
      "sx,sy,ex,ey");
  QCommandLineOption query_option("query", "Query the spatial index.",
                                  "x,y,w,h");
  QCommandLineOption dump_option("dump", "Write the world as JSON.", "file");
  QCommandLineOption quiet_option("no-map", "Skip the ASCII rendering.");
  parser.addOptions({config_option, seed_option, width_option, height_option,
                     path_option, query_option, dump_option, quiet_option});
  parser.process(app);

  Sprawl::Map::WorldConfig config;
  if (parser.isSet(config_option)) {
    QString error_msg;
    if (!Sprawl::Map::WorldConfigLoader::load_from_json_file(
            parser.value(config_option), config, &error_msg)) {
      std::cerr << "Error: " << error_msg.toStdString() << std::endl;
      return 1;
    }
  }

  auto read_positive = [&parser](const QCommandLineOption &option,
                                 int &out) -> bool {
    if (!parser.isSet(option)) {
      return true;
    }
    bool ok = false;
    int const value = parser.value(option).toInt(&ok);
    if (!ok || value <= 0) {
      std::cerr << "Error: --" << option.names().first().toStdString()
                << " expects a positive integer" << std::endl;
      return false;
    }
    out = value;
    return true;
  };
  if (!read_positive(width_option, config.grid.width) ||
      !read_positive(height_option, config.grid.height)) {
    return 1;
  }
  if (parser.isSet(seed_option)) {
    bool ok = false;
    uint const seed = parser.value(seed_option).toUInt(&ok);
    if (!ok) {
      std::cerr << "Error: --seed expects an unsigned integer" << std::endl;
      return 1;
    }
    config.terrain.seed = seed;
  }

  Sprawl::Map::WorldGenerator generator(config);
  auto const map = generator.generate();

  std::cout << "World: " << map.name().toStdString() << " (" << map.width()
            << "x" << map.height() << ", seed " << config.terrain.seed << ")"
            << std::endl;
  std::cout << "========================================" << std::endl;

  std::set<std::pair<int, int>> path_cells;
  int exit_code = 0;
  if (parser.isSet(path_option)) {
    auto coords = parse_quad(parser.value(path_option));
    if (!coords) {
      std::cerr << "Error: --path expects sx,sy,ex,ey" << std::endl;
      return 1;
    }
    auto path = run_path_request(map, *coords);
    if (path) {
      for (const auto &point : *path) {
        path_cells.insert({point.x, point.y});
      }
      std::cout << "Path: " << path->size() << " steps, length "
                << std::fixed << std::setprecision(3)
                << Sprawl::Systems::Pathfinding::path_length(*path)
                << std::endl;
    } else {
      std::cout << "Path: no path found" << std::endl;
      exit_code = 2;
    }
  }

  if (!parser.isSet(quiet_option)) {
    print_map(map, path_cells);
  }
  print_stats(map);

  if (parser.isSet(query_option)) {
    auto rect = parse_quad(parser.value(query_option));
    if (!rect) {
      std::cerr << "Error: --query expects x,y,w,h" << std::endl;
      return 1;
    }
    auto index = map.build_spatial_index();
    auto found = index->query(Sprawl::Map::Rect{
        static_cast<double>((*rect)[0]), static_cast<double>((*rect)[1]),
        static_cast<double>((*rect)[2]), static_cast<double>((*rect)[3])});
    std::cout << "\nSpatial query returned " << found.size() << " tile(s), "
              << "index depth " << index->root().depth() << std::endl;
  }

  if (parser.isSet(dump_option)) {
    const QString dump_path = parser.value(dump_option);
    if (!Sprawl::Core::Serialization::save_to_file(
            dump_path, Sprawl::Core::Serialization::serialize_world_map(map))) {
      std::cerr << "Error: could not write " << dump_path.toStdString()
                << std::endl;
      return 1;
    }
    std::cout << "\nWrote " << dump_path.toStdString() << std::endl;
  }

  return exit_code;
}
