#include "TestHelpers.h"
#include "map/GenContext.h"
#include "map/MapGenerator.h"
#include "map/gen/ArenaGenerator.h"
#include "map/gen/EntityPlacer.h"
#include "map/gen/NoiseField.h"
#include "utils/MathUtils.h"
#include <gtest/gtest.h>
#include <queue>
#include <set>
#include <utility>

// ============================================================================
// Arena Tests
// ============================================================================

TEST(ArenaTest, HellArenaHasCentralBoss) {
  MapOptions options = MakeOptions(60, 60, 12345);
  options.difficultyLevel = Difficulty::Hell;
  MapModel model = MapGenerator().GenerateMap(MapType::Arena, options);

  int bosses = 0;
  for (const EnemySpawn &enemy : model.enemySpawns) {
    if (enemy.tier != EnemyTier::Boss)
      continue;
    bosses++;
    EXPECT_EQ(enemy.x, 30);
    EXPECT_EQ(enemy.y, 30);
    EXPECT_EQ(enemy.kind, "boss");
    EXPECT_GE(enemy.level, 120);
    EXPECT_LT(enemy.level, 150);
  }
  EXPECT_EQ(bosses, 1);
  EXPECT_TRUE(model.IsWalkable(30, 30));
}

TEST(ArenaTest, ElitesRingTheBoss) {
  MapGenerator generator;
  for (uint32_t seed : {1u, 2u, 3u, 500u, 9001u}) {
    MapOptions options = MakeOptions(60, 60, seed);
    options.difficultyLevel = Difficulty::Hell;
    MapModel model = generator.GenerateMap(MapType::Arena, options);

    glm::ivec2 center = ArenaGenerator::GetCenter(60, 60);
    int elites = 0;
    for (const EnemySpawn &enemy : model.enemySpawns) {
      if (enemy.tier != EnemyTier::Elite)
        continue;
      elites++;
      double d = MathUtils::Distance(center.x, center.y, enemy.x, enemy.y);
      EXPECT_GE(d, 5.0) << "seed " << seed;
      EXPECT_LE(d, 10.0) << "seed " << seed;
      EXPECT_TRUE(model.IsWalkable(enemy.x, enemy.y)) << "seed " << seed;
      EXPECT_FALSE(enemy.groupId.has_value());

      LevelRange band =
          EntityPlacer::GetTierLevelRange(Difficulty::Hell, EnemyTier::Elite);
      EXPECT_GE(enemy.level, band.min);
      EXPECT_LT(enemy.level, band.max);
    }
    EXPECT_GE(elites, 4) << "seed " << seed;
    EXPECT_LE(elites, 7) << "seed " << seed;
    // Nothing but the boss and its elites
    EXPECT_EQ(model.enemySpawns.size(), (size_t)elites + 1) << "seed " << seed;
  }
}

TEST(ArenaTest, NoTwoEnemiesShareACell) {
  MapModel model =
      MapGenerator().GenerateMap(MapType::Arena, MakeOptions(60, 60, 77));
  for (size_t i = 0; i < model.enemySpawns.size(); ++i) {
    for (size_t j = i + 1; j < model.enemySpawns.size(); ++j) {
      const EnemySpawn &a = model.enemySpawns[i];
      const EnemySpawn &b = model.enemySpawns[j];
      EXPECT_FALSE(a.x == b.x && a.y == b.y);
    }
  }
}

TEST(ArenaTest, OutskirtsAreSolid) {
  MapModel model =
      MapGenerator().GenerateMap(MapType::Arena, MakeOptions(60, 60, 4));
  // Corners lie well past the disc and its blend band
  EXPECT_EQ(model.placementGrid(0, 0), CellKind::Wall);
  EXPECT_EQ(model.placementGrid(59, 0), CellKind::Wall);
  EXPECT_EQ(model.placementGrid(0, 59), CellKind::Wall);
  EXPECT_EQ(model.placementGrid(59, 59), CellKind::Wall);
  EXPECT_TRUE(model.rooms.empty());
  EXPECT_TRUE(model.npcSpawns.empty());
}

TEST(ArenaTest, EntranceCorridorIsOrthogonallyConnected) {
  for (uint32_t seed : {1u, 2u, 3u, 4u, 5u, 6u, 7u, 8u, 42u, 1234u}) {
    MapOptions options = MakeOptions(60, 60, seed);
    MapModel model;
    model.width = 60;
    model.height = 60;
    model.mapType = MapType::Arena;
    model.heightMap = Grid<double>(60, 60, 0.0);
    model.placementGrid = Grid<CellKind>(60, 60, CellKind::Wall);
    RandomStream rng(seed);
    NoiseField noise((int)seed, options.noiseScale);
    GenContext ctx(options, MapType::Arena, rng, noise, model);
    ArenaGenerator().Generate(ctx);

    // Past the altar the only reserved cells belong to the corridor
    glm::ivec2 center = ArenaGenerator::GetCenter(60, 60);
    double radius = ArenaGenerator::GetRadius(60, 60);
    std::set<std::pair<int, int>> corridor;
    for (int y = 0; y < 60; ++y) {
      for (int x = 0; x < 60; ++x) {
        if (ctx.IsReserved(x, y) &&
            MathUtils::Distance(center.x, center.y, x, y) > radius * 0.5) {
          corridor.insert({x, y});
          EXPECT_TRUE(model.IsWalkable(x, y)) << "seed " << seed;
        }
      }
    }
    ASSERT_FALSE(corridor.empty()) << "seed " << seed;

    std::set<std::pair<int, int>> seen;
    std::queue<std::pair<int, int>> open;
    open.push(*corridor.begin());
    seen.insert(*corridor.begin());
    const int dx[4] = {0, 1, 0, -1};
    const int dy[4] = {-1, 0, 1, 0};
    while (!open.empty()) {
      std::pair<int, int> cell = open.front();
      open.pop();
      for (int i = 0; i < 4; ++i) {
        std::pair<int, int> next(cell.first + dx[i], cell.second + dy[i]);
        if (corridor.count(next) && seen.insert(next).second)
          open.push(next);
      }
    }
    EXPECT_EQ(seen.size(), corridor.size()) << "seed " << seed;
  }
}
