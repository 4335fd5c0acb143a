#ifndef MAP_MODEL_H
#define MAP_MODEL_H

#include "../utils/Grid.h"
#include "MapOptions.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Heights below this are too low to stand on (water, pits) whatever the kind
constexpr double kWalkableHeight = 0.3;

enum class CellKind : uint8_t { Floor, Water, Chest, Obstacle, Wall };

NLOHMANN_JSON_SERIALIZE_ENUM(CellKind, {
                                           {CellKind::Floor, "floor"},
                                           {CellKind::Water, "water"},
                                           {CellKind::Chest, "chest"},
                                           {CellKind::Obstacle, "obstacle"},
                                           {CellKind::Wall, "wall"},
                                       })

enum class EnemyTier { Normal, Elite, Boss };

NLOHMANN_JSON_SERIALIZE_ENUM(EnemyTier, {
                                            {EnemyTier::Normal, "normal"},
                                            {EnemyTier::Elite, "elite"},
                                            {EnemyTier::Boss, "boss"},
                                        })

struct Room {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  int centerX = 0;
  int centerY = 0;
  int doorX = 0;
  int doorY = 0;
  bool isShop = false;

  bool Contains(int px, int py) const {
    return px >= x && px < x + width && py >= y && py < y + height;
  }

  // True if the two rectangles intersect once each is grown by `padding`
  bool Overlaps(const Room &other, int padding) const {
    return x - padding < other.x + other.width + padding &&
           x + width + padding > other.x - padding &&
           y - padding < other.y + other.height + padding &&
           y + height + padding > other.y - padding;
  }
};

struct EnemySpawn {
  int x = 0;
  int y = 0;
  std::string kind; // biome enemy name, "elite" or "boss"
  EnemyTier tier = EnemyTier::Normal;
  int level = 1;
  std::optional<int> groupId;

  bool operator==(const EnemySpawn &o) const {
    return x == o.x && y == o.y && kind == o.kind && tier == o.tier &&
           level == o.level && groupId == o.groupId;
  }
};

struct ShopItem {
  std::string id;
  int price = 0;

  bool operator==(const ShopItem &o) const {
    return id == o.id && price == o.price;
  }
};

struct NpcSpawn {
  int x = 0;
  int y = 0;
  std::string kind;
  bool isShop = false;
  std::optional<std::string> shopKind;
  std::optional<std::vector<ShopItem>> shopItems;
  std::vector<std::string> dialogueLines;

  bool operator==(const NpcSpawn &o) const {
    return x == o.x && y == o.y && kind == o.kind && isShop == o.isShop &&
           shopKind == o.shopKind && shopItems == o.shopItems &&
           dialogueLines == o.dialogueLines;
  }
};

// Finished output of one GenerateMap call. Consumers treat it as read-only;
// a new floor means a new model.
struct MapModel {
  int width = 0;
  int height = 0;
  int tileSize = 32;
  uint32_t seed = 0;
  MapType mapType = MapType::Dungeon;
  Difficulty difficulty = Difficulty::Normal;

  Grid<double> heightMap;
  Grid<CellKind> placementGrid;

  std::vector<Room> rooms;
  std::vector<EnemySpawn> enemySpawns;
  std::vector<NpcSpawn> npcSpawns;

  bool InBounds(int x, int y) const {
    return x >= 0 && x < width && y >= 0 && y < height;
  }

  bool IsWalkable(int x, int y) const {
    if (!InBounds(x, y))
      return false;
    return placementGrid(x, y) == CellKind::Floor &&
           heightMap(x, y) >= kWalkableHeight;
  }

  size_t CountCells(CellKind kind) const;
  size_t CountWalkable() const;

  // One character per cell, enemies and NPCs drawn over the terrain
  std::string ToAscii(bool withEntities = true) const;
};

void to_json(json &j, const Room &r);
void to_json(json &j, const EnemySpawn &e);
void to_json(json &j, const ShopItem &item);
void to_json(json &j, const NpcSpawn &n);
void to_json(json &j, const MapModel &m);

#endif
