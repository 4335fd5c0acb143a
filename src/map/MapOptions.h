#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

enum class MapType { Dungeon, Field, Arena, Town };

enum class Difficulty { Normal, Nightmare, Hell };

NLOHMANN_JSON_SERIALIZE_ENUM(MapType, {
                                          {MapType::Dungeon, "dungeon"},
                                          {MapType::Field, "field"},
                                          {MapType::Arena, "arena"},
                                          {MapType::Town, "town"},
                                      })

NLOHMANN_JSON_SERIALIZE_ENUM(Difficulty, {
                                             {Difficulty::Normal, "normal"},
                                             {Difficulty::Nightmare, "nightmare"},
                                             {Difficulty::Hell, "hell"},
                                         })

const char *ToString(MapType type);
const char *ToString(Difficulty difficulty);
bool ParseMapType(const std::string &name, MapType &out);
bool ParseDifficulty(const std::string &name, Difficulty &out);

// Largest width or height Sanitize lets through. Keeps cell counts well
// inside int range for the grids and the pathfinder.
constexpr int kMaxMapSize = 4096;

struct MapOptions {
  int width = 100;
  int height = 100;
  uint32_t seed = 0;
  int tileSize = 32;
  float noiseScale = 0.1f;

  // Dungeon rooms
  int roomMinSize = 5;
  int roomMaxSize = 15;
  int roomCount = 10;

  // Densities (probability per candidate cell)
  float enemyDensity = 0.05f;
  float chestDensity = 0.02f;
  float obstacleDensity = 0.01f;
  float wallDensity = 0.015f;
  float npcDensity = 0.01f;

  Difficulty difficultyLevel = Difficulty::Normal;

  // Clamp degenerate values in place. Returns false if anything changed.
  bool Sanitize();

  // Missing keys keep their current values
  bool LoadFromFile(const std::string &filepath);
  bool SaveToFile(const std::string &filepath) const;
};

// Density multipliers applied by difficulty before the per-map-type ones
struct DifficultyScaling {
  float enemy = 1.0f;
  float obstacle = 1.0f;
  float chest = 1.0f;
};

DifficultyScaling GetDifficultyScaling(Difficulty difficulty);

// Level band an ordinary enemy is drawn from
struct LevelRange {
  int min;
  int max;
};

LevelRange GetLevelRange(Difficulty difficulty);

// nlohmann::json serialization
inline void to_json(json &j, const MapOptions &o) {
  j = json{{"width", o.width},
           {"height", o.height},
           {"seed", o.seed},
           {"tileSize", o.tileSize},
           {"noiseScale", o.noiseScale},
           {"roomMinSize", o.roomMinSize},
           {"roomMaxSize", o.roomMaxSize},
           {"roomCount", o.roomCount},
           {"enemyDensity", o.enemyDensity},
           {"chestDensity", o.chestDensity},
           {"obstacleDensity", o.obstacleDensity},
           {"wallDensity", o.wallDensity},
           {"npcDensity", o.npcDensity},
           {"difficultyLevel", o.difficultyLevel}};
}

inline void from_json(const json &j, MapOptions &o) {
  o.width = j.value("width", o.width);
  o.height = j.value("height", o.height);
  o.seed = j.value("seed", o.seed);
  o.tileSize = j.value("tileSize", o.tileSize);
  o.noiseScale = j.value("noiseScale", o.noiseScale);
  o.roomMinSize = j.value("roomMinSize", o.roomMinSize);
  o.roomMaxSize = j.value("roomMaxSize", o.roomMaxSize);
  o.roomCount = j.value("roomCount", o.roomCount);
  o.enemyDensity = j.value("enemyDensity", o.enemyDensity);
  o.chestDensity = j.value("chestDensity", o.chestDensity);
  o.obstacleDensity = j.value("obstacleDensity", o.obstacleDensity);
  o.wallDensity = j.value("wallDensity", o.wallDensity);
  o.npcDensity = j.value("npcDensity", o.npcDensity);
  if (j.contains("difficultyLevel"))
    j.at("difficultyLevel").get_to(o.difficultyLevel);
}
