#include "MapOptions.h"
#include "../debug/Logger.h"
#include <algorithm>
#include <fstream>

const char *ToString(MapType type) {
  switch (type) {
  case MapType::Dungeon:
    return "dungeon";
  case MapType::Field:
    return "field";
  case MapType::Arena:
    return "arena";
  case MapType::Town:
    return "town";
  }
  return "dungeon";
}

const char *ToString(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Normal:
    return "normal";
  case Difficulty::Nightmare:
    return "nightmare";
  case Difficulty::Hell:
    return "hell";
  }
  return "normal";
}

bool ParseMapType(const std::string &name, MapType &out) {
  for (MapType t :
       {MapType::Dungeon, MapType::Field, MapType::Arena, MapType::Town}) {
    if (name == ToString(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

bool ParseDifficulty(const std::string &name, Difficulty &out) {
  for (Difficulty d :
       {Difficulty::Normal, Difficulty::Nightmare, Difficulty::Hell}) {
    if (name == ToString(d)) {
      out = d;
      return true;
    }
  }
  return false;
}

DifficultyScaling GetDifficultyScaling(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Nightmare:
    return {1.5f, 1.2f, 1.0f};
  case Difficulty::Hell:
    return {2.5f, 1.5f, 1.3f}; // more loot too
  default:
    return {1.0f, 1.0f, 1.0f};
  }
}

LevelRange GetLevelRange(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Nightmare:
    return {30, 60};
  case Difficulty::Hell:
    return {60, 100};
  default:
    return {1, 30};
  }
}

static bool ClampDensity(float &value, const char *name) {
  float clamped = std::max(0.0f, std::min(1.0f, value));
  if (clamped != value) {
    LOG_GEN_WARN("MapOptions: {} {} out of [0,1], clamped to {}", name, value,
                 clamped);
    value = clamped;
    return false;
  }
  return true;
}

bool MapOptions::Sanitize() {
  bool ok = true;

  if (width < 1 || height < 1) {
    LOG_GEN_WARN("MapOptions: invalid size {}x{}, using at least 1x1", width,
                 height);
    width = std::max(1, width);
    height = std::max(1, height);
    ok = false;
  }
  if (width > kMaxMapSize || height > kMaxMapSize) {
    LOG_GEN_WARN("MapOptions: size {}x{} too large, using at most {}x{}",
                 width, height, kMaxMapSize, kMaxMapSize);
    width = std::min(width, kMaxMapSize);
    height = std::min(height, kMaxMapSize);
    ok = false;
  }
  if (tileSize < 1) {
    LOG_GEN_WARN("MapOptions: invalid tileSize {}, using 32", tileSize);
    tileSize = 32;
    ok = false;
  }
  if (noiseScale <= 0.0f) {
    LOG_GEN_WARN("MapOptions: invalid noiseScale {}, using 0.1", noiseScale);
    noiseScale = 0.1f;
    ok = false;
  }
  if (roomMinSize < 1) {
    roomMinSize = 1;
    ok = false;
  }
  if (roomMaxSize < roomMinSize) {
    LOG_GEN_WARN("MapOptions: roomMaxSize {} below roomMinSize {}, swapped",
                 roomMaxSize, roomMinSize);
    std::swap(roomMinSize, roomMaxSize);
    roomMinSize = std::max(1, roomMinSize);
    ok = false;
  }
  if (roomCount < 0) {
    roomCount = 0;
    ok = false;
  }

  ok = ClampDensity(enemyDensity, "enemyDensity") && ok;
  ok = ClampDensity(chestDensity, "chestDensity") && ok;
  ok = ClampDensity(obstacleDensity, "obstacleDensity") && ok;
  ok = ClampDensity(wallDensity, "wallDensity") && ok;
  ok = ClampDensity(npcDensity, "npcDensity") && ok;
  return ok;
}

bool MapOptions::LoadFromFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LOG_ERROR("Failed to open map options: {}", filepath);
    return false;
  }

  json j;
  try {
    j = json::parse(file, nullptr, true, true);
  } catch (const std::exception &e) {
    LOG_ERROR("JSON Parse Error in {}: {}", filepath, e.what());
    return false;
  }

  if (!j.is_object()) {
    LOG_ERROR("Map options in {} must be a JSON object", filepath);
    return false;
  }

  MapOptions loaded = *this;
  try {
    from_json(j, loaded);
  } catch (const json::exception &e) {
    LOG_ERROR("Invalid value in {}: {}", filepath, e.what());
    return false;
  }

  // The enum serializer silently maps unknown names to the first entry
  if (j.contains("difficultyLevel") && j["difficultyLevel"].is_string()) {
    Difficulty parsed;
    if (!ParseDifficulty(j["difficultyLevel"].get<std::string>(), parsed)) {
      LOG_WARN("Unknown difficultyLevel '{}' in {}, keeping '{}'",
               j["difficultyLevel"].get<std::string>(), filepath,
               ToString(difficultyLevel));
      loaded.difficultyLevel = difficultyLevel;
    }
  }

  *this = loaded;
  LOG_INFO("Loaded map options from {}", filepath);
  return true;
}

bool MapOptions::SaveToFile(const std::string &filepath) const {
  std::ofstream file(filepath);
  if (!file.is_open()) {
    LOG_ERROR("Failed to write map options: {}", filepath);
    return false;
  }
  file << json(*this).dump(2) << "\n";
  return true;
}
