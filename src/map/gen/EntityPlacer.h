#ifndef ENTITY_PLACER_H
#define ENTITY_PLACER_H

#include "../GenContext.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

// Enemy and NPC spawns. Spawns never change terrain; an occupancy mask keeps
// two spawns off the same cell.
class EntityPlacer {
public:
  explicit EntityPlacer(GenContext &ctx);

  void PlaceEnemies();
  // Town only: shopkeepers, residents and free-roaming townsfolk
  void PlaceNpcs();

  // Enemy density after difficulty and map type scaling
  static double GetEnemyDensity(const MapOptions &options, MapType type);

  // floor(min + Next() * (max - min)) over the tier's band for the difficulty
  static int DetermineLevel(RandomStream &rng, Difficulty difficulty,
                            EnemyTier tier);
  static LevelRange GetTierLevelRange(Difficulty difficulty, EnemyTier tier);

private:
  void PlaceArenaEnemies();
  void PlaceEnemyGroups(std::vector<glm::ivec2> &candidates);
  void AddEnemy(int x, int y, const std::string &kind,
                std::optional<int> groupId = std::nullopt);

  std::string DetermineEnemyKind();
  NpcSpawn MakeShopkeeper(const Room &room);
  NpcSpawn MakeTownsfolk(int x, int y);
  std::vector<std::string> DrawTownsfolkLines();

  bool IsFree(int x, int y) const {
    return ctx.IsWalkable(x, y) && !occupied.Get(x, y, true);
  }

  GenContext &ctx;
  Grid<bool> occupied;
};

#endif
