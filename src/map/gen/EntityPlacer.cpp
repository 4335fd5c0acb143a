#include "EntityPlacer.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "../../utils/MathUtils.h"
#include "ArenaGenerator.h"
#include "SpawnTables.h"
#include "TownGenerator.h"
#include <cmath>

namespace {
constexpr int kEliteSampleAttempts = 32;
constexpr int kEliteMinDistance = 5;
constexpr int kEliteMaxDistance = 10;
constexpr double kResidentChance = 0.7;

const char *kEliteKind = "elite";
const char *kBossKind = "boss";

glm::ivec2 TakeAt(std::vector<glm::ivec2> &pool, size_t index) {
  glm::ivec2 cell = pool[index];
  pool[index] = pool.back();
  pool.pop_back();
  return cell;
}
} // namespace

EntityPlacer::EntityPlacer(GenContext &ctx)
    : ctx(ctx), occupied(ctx.Width(), ctx.Height(), false) {}

double EntityPlacer::GetEnemyDensity(const MapOptions &options,
                                     MapType type) {
  return options.enemyDensity *
         GetDifficultyScaling(options.difficultyLevel).enemy *
         GetPlacementMultipliers(type).enemy;
}

LevelRange EntityPlacer::GetTierLevelRange(Difficulty difficulty,
                                           EnemyTier tier) {
  LevelRange range = GetLevelRange(difficulty);
  if (tier == EnemyTier::Elite) {
    range.min = (int)std::floor(range.min * 1.5);
    range.max = (int)std::floor(range.max * 1.2);
  } else if (tier == EnemyTier::Boss) {
    range.min = range.min * 2;
    range.max = (int)std::floor(range.max * 1.5);
  }
  return range;
}

int EntityPlacer::DetermineLevel(RandomStream &rng, Difficulty difficulty,
                                 EnemyTier tier) {
  LevelRange range = GetTierLevelRange(difficulty, tier);
  return (int)std::floor(range.min + rng.Next() * (range.max - range.min));
}

void EntityPlacer::PlaceEnemies() {
  PROFILE_SCOPE("EntityPlacer::Enemies");

  if (ctx.mapType == MapType::Arena) {
    PlaceArenaEnemies();
    return;
  }

  std::vector<glm::ivec2> candidates;
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (ctx.IsWalkable(x, y))
        candidates.emplace_back(x, y);
    }
  }

  double density = GetEnemyDensity(ctx.options, ctx.mapType);
  size_t count = (size_t)std::floor(candidates.size() * density);

  for (size_t i = 0; i < count && !candidates.empty(); ++i) {
    glm::ivec2 cell = TakeAt(candidates, ctx.rng.NextIndex(candidates.size()));
    AddEnemy(cell.x, cell.y, DetermineEnemyKind());
  }

  PlaceEnemyGroups(candidates);

  LOG_GEN_DEBUG("EntityPlacer: {} enemies ({} solo, density {:.4f})",
                ctx.model.enemySpawns.size(), count, density);
}

void EntityPlacer::PlaceEnemyGroups(std::vector<glm::ivec2> &candidates) {
  RandomStream &rng = ctx.rng;
  int groups = rng.NextInt(3, 7);

  for (int g = 0; g < groups && !candidates.empty(); ++g) {
    glm::ivec2 anchor = TakeAt(candidates, rng.NextIndex(candidates.size()));
    std::string kind = DetermineEnemyKind();
    int size = rng.NextInt(3, 6);

    for (int i = 0; i < size; ++i) {
      int radius = rng.NextInt(1, 3);
      double angle = rng.NextAngle();
      glm::ivec2 p = MathUtils::PolarOffset(anchor.x, anchor.y, angle, radius);
      if (!IsFree(p.x, p.y))
        continue;
      AddEnemy(p.x, p.y, kind, g);
    }
  }
}

void EntityPlacer::PlaceArenaEnemies() {
  RandomStream &rng = ctx.rng;
  glm::ivec2 center = ArenaGenerator::GetCenter(ctx.Width(), ctx.Height());

  AddEnemy(center.x, center.y, kBossKind);

  int elites = rng.NextInt(4, 7);
  int placed = 0;
  for (int i = 0; i < elites; ++i) {
    for (int attempt = 0; attempt < kEliteSampleAttempts; ++attempt) {
      double angle = rng.NextAngle();
      int dist = rng.NextInt(kEliteMinDistance, kEliteMaxDistance);
      glm::ivec2 p = MathUtils::PolarOffset(center.x, center.y, angle, dist);

      // Flooring can push the cell out of the ring
      double actual = MathUtils::Distance(center.x, center.y, p.x, p.y);
      if (actual < kEliteMinDistance || actual > kEliteMaxDistance ||
          !IsFree(p.x, p.y))
        continue;

      AddEnemy(p.x, p.y, kEliteKind);
      placed++;
      break;
    }
  }

  if (placed < elites)
    LOG_GEN_WARN("Arena: placed {} of {} elites", placed, elites);
}

void EntityPlacer::AddEnemy(int x, int y, const std::string &kind,
                            std::optional<int> groupId) {
  EnemySpawn spawn;
  spawn.x = x;
  spawn.y = y;
  spawn.kind = kind;
  if (kind == kBossKind)
    spawn.tier = EnemyTier::Boss;
  else if (kind == kEliteKind)
    spawn.tier = EnemyTier::Elite;
  spawn.level = DetermineLevel(ctx.rng, ctx.options.difficultyLevel, spawn.tier);
  spawn.groupId = groupId;

  occupied.Set(x, y, true);
  ctx.model.enemySpawns.push_back(std::move(spawn));
}

std::string EntityPlacer::DetermineEnemyKind() {
  if (ctx.rng.Chance(GetEliteChance(ctx.options.difficultyLevel)))
    return kEliteKind;
  const std::vector<std::string> &pool = GetEnemyPool(ctx.mapType);
  return pool[ctx.rng.NextIndex(pool.size())];
}

void EntityPlacer::PlaceNpcs() {
  PROFILE_SCOPE("EntityPlacer::Npcs");
  std::vector<NpcSpawn> &npcs = ctx.model.npcSpawns;

  for (const Room &room : ctx.model.rooms) {
    if (room.isShop) {
      npcs.push_back(MakeShopkeeper(room));
      occupied.Set(room.centerX, room.centerY, true);
    } else if (ctx.rng.Chance(kResidentChance)) {
      npcs.push_back(MakeTownsfolk(room.centerX, room.centerY));
      occupied.Set(room.centerX, room.centerY, true);
    }
  }
  size_t housed = npcs.size();

  glm::ivec2 center(ctx.Width() / 2, ctx.Height() / 2);
  double townRadius = TownGenerator::GetTownRadius(ctx.Width(), ctx.Height());

  std::vector<glm::ivec2> candidates;
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (!IsFree(x, y) ||
          MathUtils::Distance(center.x, center.y, x, y) >= townRadius)
        continue;
      bool indoors = false;
      for (const Room &room : ctx.model.rooms) {
        if (room.Contains(x, y)) {
          indoors = true;
          break;
        }
      }
      if (!indoors)
        candidates.emplace_back(x, y);
    }
  }

  size_t count =
      (size_t)std::floor(candidates.size() * ctx.options.npcDensity);
  for (size_t i = 0; i < count && !candidates.empty(); ++i) {
    glm::ivec2 cell = TakeAt(candidates, ctx.rng.NextIndex(candidates.size()));
    npcs.push_back(MakeTownsfolk(cell.x, cell.y));
    occupied.Set(cell.x, cell.y, true);
  }

  LOG_GEN_DEBUG("EntityPlacer: {} NPCs ({} in buildings)", npcs.size(),
                housed);
}

NpcSpawn EntityPlacer::MakeShopkeeper(const Room &room) {
  RandomStream &rng = ctx.rng;
  const std::vector<std::string> &kinds = GetShopkeeperKinds();
  const std::vector<std::string> &shops = GetShopKinds();

  NpcSpawn npc;
  npc.x = room.centerX;
  npc.y = room.centerY;
  npc.isShop = true;
  npc.kind = kinds[rng.NextIndex(kinds.size())];
  npc.shopKind = shops[rng.NextIndex(shops.size())];

  std::vector<ShopItem> items;
  int itemCount = rng.NextInt(5, 14);
  for (int i = 0; i < itemCount; ++i)
    items.push_back({"item_" + std::to_string(i), rng.NextInt(10, 1009)});
  npc.shopItems = std::move(items);

  npc.dialogueLines = GetShopGreetings();
  return npc;
}

NpcSpawn EntityPlacer::MakeTownsfolk(int x, int y) {
  const std::vector<std::string> &kinds = GetTownsfolkKinds();

  NpcSpawn npc;
  npc.x = x;
  npc.y = y;
  npc.kind = kinds[ctx.rng.NextIndex(kinds.size())];
  npc.dialogueLines = DrawTownsfolkLines();
  return npc;
}

std::vector<std::string> EntityPlacer::DrawTownsfolkLines() {
  std::vector<std::string> pool = GetTownsfolkLines();
  std::vector<std::string> lines;
  int count = ctx.rng.NextInt(2, 5);
  for (int i = 0; i < count && !pool.empty(); ++i) {
    size_t index = ctx.rng.NextIndex(pool.size());
    lines.push_back(pool[index]);
    pool.erase(pool.begin() + index);
  }
  return lines;
}
