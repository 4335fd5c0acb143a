#include "MapGenerator.h"
#include "../debug/Logger.h"
#include "../debug/Profiler.h"
#include "GenContext.h"
#include "LayoutGenerator.h"
#include "gen/ArenaGenerator.h"
#include "gen/EntityPlacer.h"
#include "gen/NoiseField.h"
#include "gen/ObjectPlacer.h"
#include "gen/RoomLayoutGenerator.h"
#include "gen/TerrainFieldGenerator.h"
#include "gen/TownGenerator.h"

std::unique_ptr<LayoutGenerator> MapGenerator::CreateLayout(MapType type) {
  switch (type) {
  case MapType::Field:
    return std::make_unique<TerrainFieldGenerator>();
  case MapType::Arena:
    return std::make_unique<ArenaGenerator>();
  case MapType::Town:
    return std::make_unique<TownGenerator>();
  case MapType::Dungeon:
  default:
    return std::make_unique<RoomLayoutGenerator>();
  }
}

MapModel MapGenerator::GenerateMap(MapType type,
                                   const MapOptions &options) const {
  PROFILE_SCOPE("GenerateMap");

  MapOptions opt = options;
  opt.Sanitize();

  MapModel model;
  model.width = opt.width;
  model.height = opt.height;
  model.tileSize = opt.tileSize;
  model.seed = opt.seed;
  model.mapType = type;
  model.difficulty = opt.difficultyLevel;
  model.heightMap = Grid<double>(opt.width, opt.height, 0.0);
  model.placementGrid = Grid<CellKind>(opt.width, opt.height, CellKind::Floor);

  RandomStream rng(opt.seed);
  // First draw of the run seeds the noise, so the seed alone fixes the map
  int noiseSeed = (int)(rng.Next() * 2147483647.0);
  NoiseField noise(noiseSeed, opt.noiseScale);

  GenContext ctx(opt, type, rng, noise, model);

  std::unique_ptr<LayoutGenerator> layout = CreateLayout(type);
  layout->Generate(ctx);

  ObjectPlacer objects;
  objects.Place(ctx);

  EntityPlacer entities(ctx);
  entities.PlaceEnemies();
  if (type == MapType::Town)
    entities.PlaceNpcs();

  LOG_GEN_INFO("Generated {} map {}x{} seed {} ({}): {} rooms, {} enemies, "
               "{} NPCs",
               ToString(type), model.width, model.height, model.seed,
               ToString(model.difficulty), model.rooms.size(),
               model.enemySpawns.size(), model.npcSpawns.size());
  return model;
}
