#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "debug/Benchmark.h"
#include "debug/Logger.h"
#include "debug/Profiler.h"
#include "map/MapGenerator.h"
#include "map/MapOptions.h"
#include "nav/PathfindingGrid.h"

static void PrintUsage() {
  std::cout
      << "Usage: mapgen [options]\n"
      << "  --type T         dungeon | field | arena | town (default dungeon)\n"
      << "  --config F       load MapOptions from a JSON file\n"
      << "  --seed N         random seed\n"
      << "  --width W        map width in cells\n"
      << "  --height H       map height in cells\n"
      << "  --difficulty D   normal | nightmare | hell\n"
      << "  --out F          write the generated map as JSON\n"
      << "  --no-ascii       skip the ASCII preview\n"
      << "  --benchmark N    generate N maps of every type and print timings\n"
      << "  --verbose        debug logging\n"
      << "  --help           show this message\n";
}

static bool ParseInt(const std::string &text, long long &out) {
  try {
    size_t used = 0;
    out = std::stoll(text, &used);
    return used == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

static void PrintBenchmark(MapType type, const BenchmarkResult &result) {
  std::cout << ToString(type) << ": " << result.mapsGenerated << " maps, "
            << result.totalTimeMs << " ms total, " << result.avgMapTimeMs
            << " ms avg\n";
  for (const auto &kv : result.stepAvgTimes)
    std::cout << "    " << kv.first << ": " << kv.second << " ms\n";
}

int main(int argc, char **argv) {
  Logger::Init();

  MapOptions options;
  MapType type = MapType::Dungeon;
  std::string outFile;
  bool ascii = true;
  int benchmarkRuns = 0;

  // The config file is applied first so explicit flags override it
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config" &&
        !options.LoadFromFile(argv[i + 1])) {
      LOG_ERROR("Could not load config {}, using defaults", argv[i + 1]);
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string &value) {
      if (i + 1 >= argc) {
        LOG_ERROR("Missing value for {}", arg);
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    long long number = 0;
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return EXIT_SUCCESS;
    } else if (arg == "--no-ascii") {
      ascii = false;
    } else if (arg == "--verbose") {
      Logger::SetLevel(spdlog::level::debug);
    } else if (arg == "--config") {
      if (!next(value))
        return EXIT_FAILURE;
    } else if (arg == "--type") {
      if (!next(value))
        return EXIT_FAILURE;
      if (!ParseMapType(value, type)) {
        LOG_ERROR("Unknown map type '{}'", value);
        return EXIT_FAILURE;
      }
    } else if (arg == "--difficulty") {
      if (!next(value))
        return EXIT_FAILURE;
      if (!ParseDifficulty(value, options.difficultyLevel)) {
        LOG_ERROR("Unknown difficulty '{}'", value);
        return EXIT_FAILURE;
      }
    } else if (arg == "--out") {
      if (!next(outFile))
        return EXIT_FAILURE;
    } else if (arg == "--seed" || arg == "--width" || arg == "--height" ||
               arg == "--benchmark") {
      if (!next(value))
        return EXIT_FAILURE;
      if (!ParseInt(value, number) || number < 0) {
        LOG_ERROR("Invalid value '{}' for {}", value, arg);
        return EXIT_FAILURE;
      }
      if (arg == "--seed")
        options.seed = (uint32_t)number;
      else if (arg == "--width")
        options.width = (int)number;
      else if (arg == "--height")
        options.height = (int)number;
      else
        benchmarkRuns = (int)number;
    } else {
      LOG_ERROR("Unknown argument '{}'", arg);
      PrintUsage();
      return EXIT_FAILURE;
    }
  }

  if (benchmarkRuns > 0) {
    LOG_INFO("Benchmarking {} maps per type at {}x{}", benchmarkRuns,
             options.width, options.height);
    for (MapType t :
         {MapType::Dungeon, MapType::Field, MapType::Arena, MapType::Town}) {
      PrintBenchmark(t, RunMapGenBenchmark(options, t, benchmarkRuns));
    }
    return EXIT_SUCCESS;
  }

  MapGenerator generator;
  MapModel model = generator.GenerateMap(type, options);
  PathfindingGrid grid(model);

  std::cout << ToString(model.mapType) << " " << model.width << "x"
            << model.height << " seed " << model.seed << " ("
            << ToString(model.difficulty) << ")\n"
            << "  rooms: " << model.rooms.size()
            << "  enemies: " << model.enemySpawns.size()
            << "  npcs: " << model.npcSpawns.size()
            << "  walkable: " << grid.CountWalkable()
            << "  chests: " << model.CountCells(CellKind::Chest) << "\n";

  if (ascii)
    std::cout << model.ToAscii();

  if (!outFile.empty()) {
    std::ofstream file(outFile);
    if (!file.is_open()) {
      LOG_ERROR("Failed to write map: {}", outFile);
      return EXIT_FAILURE;
    }
    file << json(model).dump(2) << "\n";
    LOG_INFO("Wrote {}", outFile);
  }

  for (const auto &kv : Profiler::Get().GetResults()) {
    if (!kv.second.empty())
      LOG_DEBUG("{}: {:.3f} ms", kv.first, kv.second.back());
  }

  return EXIT_SUCCESS;
}
