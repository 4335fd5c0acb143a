#include "TestHelpers.h"
#include "map/GenContext.h"
#include "map/MapGenerator.h"
#include "map/gen/EntityPlacer.h"
#include "map/gen/NoiseField.h"
#include "map/gen/ObjectPlacer.h"
#include "map/gen/RoomLayoutGenerator.h"
#include "map/gen/SpawnTables.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <gtest/gtest.h>
#include <map>
#include <memory>

namespace {
// One generation run assembled by hand so single passes can be inspected
class PlacementFixture : public ::testing::Test {
protected:
  void Build(MapType type, int width, int height, uint32_t seed,
             double floorHeight = 0.45) {
    options = MakeOptions(width, height, seed);
    model = MapModel();
    model.width = width;
    model.height = height;
    model.mapType = type;
    model.heightMap = Grid<double>(width, height, floorHeight);
    model.placementGrid = Grid<CellKind>(width, height, CellKind::Floor);
    rng = std::make_unique<RandomStream>(seed);
    noise = std::make_unique<NoiseField>((int)seed, options.noiseScale);
    ctx = std::make_unique<GenContext>(options, type, *rng, *noise, model);
  }

  size_t CountCandidates() const {
    size_t count = 0;
    for (int y = 0; y < model.height; ++y) {
      for (int x = 0; x < model.width; ++x) {
        if (model.IsWalkable(x, y) && !ctx->IsReserved(x, y))
          count++;
      }
    }
    return count;
  }

  MapOptions options;
  MapModel model;
  std::unique_ptr<RandomStream> rng;
  std::unique_ptr<NoiseField> noise;
  std::unique_ptr<GenContext> ctx;
};
} // namespace

// ============================================================================
// ObjectPlacer Tests
// ============================================================================

TEST_F(PlacementFixture, ChestsAndObstaclesTrackDensity) {
  Build(MapType::Dungeon, 50, 50, 3);
  ObjectPlacementStats stats = ObjectPlacer().Place(*ctx);

  EXPECT_EQ(stats.candidates, 2500u);
  EXPECT_DOUBLE_EQ(stats.chestDensity,
                   ObjectPlacer::GetChestDensity(options, MapType::Dungeon));
  size_t chestQuota = (size_t)std::floor(2500 * stats.chestDensity);
  size_t obstacleQuota = (size_t)std::floor(2500 * stats.obstacleDensity);

  EXPECT_NEAR((double)stats.chests, (double)chestQuota, 1.0);
  EXPECT_NEAR((double)stats.obstacles, (double)obstacleQuota, 1.0);
  EXPECT_EQ(model.CountCells(CellKind::Chest), stats.chests);
  EXPECT_EQ(model.CountCells(CellKind::Obstacle), stats.obstacles);
}

TEST_F(PlacementFixture, DungeonObjectsMatchCandidates) {
  Build(MapType::Dungeon, 80, 60, 42);
  RoomLayoutGenerator().Generate(*ctx);
  size_t candidates = CountCandidates();
  size_t chestsBefore = model.CountCells(CellKind::Chest);

  ObjectPlacementStats stats = ObjectPlacer().Place(*ctx);
  EXPECT_EQ(stats.candidates, candidates);
  EXPECT_EQ(chestsBefore, 0u);
  EXPECT_EQ(model.CountCells(CellKind::Chest), stats.chests);

  double expected = candidates * stats.chestDensity;
  EXPECT_LE((double)stats.chests, expected + 1.0);
  EXPECT_TRUE(AllDoorsConnected(model));
}

TEST_F(PlacementFixture, ReservedCellsStayOpen) {
  Build(MapType::Dungeon, 20, 20, 5);
  options.chestDensity = 1.0f;
  for (int x = 0; x < 20; ++x)
    ctx->Reserve(x, 10);

  ObjectPlacer().Place(*ctx);
  for (int x = 0; x < 20; ++x)
    EXPECT_EQ(model.placementGrid(x, 10), CellKind::Floor);
}

TEST_F(PlacementFixture, ObstaclesRaiseLowGround) {
  struct Expected {
    MapType type;
    double min;
    double max;
  };
  const Expected ranges[] = {{MapType::Dungeon, 0.6, 0.8},
                             {MapType::Field, 0.5, 0.8},
                             {MapType::Arena, 0.5, 0.6},
                             {MapType::Town, 0.5, 0.6}};

  for (const Expected &expected : ranges) {
    Build(expected.type, 40, 40, 8, 0.32);
    options.obstacleDensity = 0.2f;
    ObjectPlacementStats stats = ObjectPlacer().Place(*ctx);
    ASSERT_GT(stats.obstacles, 0u) << ToString(expected.type);

    PlacementMultipliers m = GetPlacementMultipliers(expected.type);
    EXPECT_DOUBLE_EQ(m.obstacleHeightMin, expected.min);
    EXPECT_DOUBLE_EQ(m.obstacleHeightMax, expected.max);

    for (int y = 0; y < 40; ++y) {
      for (int x = 0; x < 40; ++x) {
        double h = model.heightMap(x, y);
        if (model.placementGrid(x, y) == CellKind::Obstacle) {
          EXPECT_GE(h, expected.min) << ToString(expected.type);
          EXPECT_LT(h, expected.max) << ToString(expected.type);
        } else if (model.placementGrid(x, y) == CellKind::Chest) {
          EXPECT_DOUBLE_EQ(h, 0.32);
        }
      }
    }
  }
}

TEST(ObjectPlacerTest, DensityTables) {
  MapOptions options;
  EXPECT_NEAR(ObjectPlacer::GetChestDensity(options, MapType::Dungeon), 0.03,
              1e-6);
  EXPECT_NEAR(ObjectPlacer::GetObstacleDensity(options, MapType::Field), 0.013,
              1e-6);
  options.difficultyLevel = Difficulty::Hell;
  EXPECT_NEAR(ObjectPlacer::GetChestDensity(options, MapType::Town),
              0.02 * 1.3 * 0.1, 1e-6);
  EXPECT_NEAR(ObjectPlacer::GetObstacleDensity(options, MapType::Arena),
              0.01 * 1.5 * 0.5, 1e-6);
}

// ============================================================================
// EntityPlacer Tests
// ============================================================================

TEST_F(PlacementFixture, SoloEnemiesFollowDensity) {
  Build(MapType::Dungeon, 80, 60, 42);
  RoomLayoutGenerator().Generate(*ctx);
  ObjectPlacer().Place(*ctx);

  size_t walkable = model.CountWalkable();
  double density = EntityPlacer::GetEnemyDensity(options, MapType::Dungeon);
  EntityPlacer(*ctx).PlaceEnemies();

  size_t solo = 0;
  for (const EnemySpawn &enemy : model.enemySpawns) {
    EXPECT_TRUE(model.IsWalkable(enemy.x, enemy.y));
    if (!enemy.groupId)
      solo++;
  }
  double expected = std::floor(walkable * density);
  EXPECT_NEAR((double)solo, expected, 1.0);
}

TEST_F(PlacementFixture, GroupsShareKindAndStayTogether) {
  Build(MapType::Field, 60, 60, 19);
  EntityPlacer(*ctx).PlaceEnemies();

  std::map<int, std::vector<EnemySpawn>> groups;
  for (const EnemySpawn &enemy : model.enemySpawns) {
    if (enemy.groupId)
      groups[*enemy.groupId].push_back(enemy);
  }

  ASSERT_FALSE(groups.empty());
  EXPECT_LE(groups.size(), 7u);
  for (const auto &kv : groups) {
    EXPECT_GE(kv.first, 0);
    EXPECT_LT(kv.first, 7);
    EXPECT_LE(kv.second.size(), 6u);
    for (const EnemySpawn &a : kv.second) {
      EXPECT_EQ(a.kind, kv.second.front().kind);
      for (const EnemySpawn &b : kv.second) {
        EXPECT_LE(std::abs(a.x - b.x), 8);
        EXPECT_LE(std::abs(a.y - b.y), 8);
      }
    }
  }
}

TEST_F(PlacementFixture, NoSpawnsWithoutGround) {
  Build(MapType::Dungeon, 20, 20, 1);
  model.placementGrid.Fill(CellKind::Wall);
  EntityPlacer(*ctx).PlaceEnemies();
  EXPECT_TRUE(model.enemySpawns.empty());
}

TEST(EntityPlacerTest, EliteKindMatchesTier) {
  MapOptions options = MakeOptions(80, 80, 6);
  options.difficultyLevel = Difficulty::Hell;
  MapModel model = MapGenerator().GenerateMap(MapType::Dungeon, options);

  const std::vector<std::string> &pool = GetEnemyPool(MapType::Dungeon);
  int elites = 0;
  for (const EnemySpawn &enemy : model.enemySpawns) {
    EXPECT_NE(enemy.tier, EnemyTier::Boss);
    if (enemy.tier == EnemyTier::Elite) {
      elites++;
      EXPECT_EQ(enemy.kind, "elite");
    } else {
      EXPECT_NE(std::find(pool.begin(), pool.end(), enemy.kind), pool.end())
          << enemy.kind;
    }
  }
  EXPECT_GT(elites, 0);
}

TEST(EntityPlacerTest, LevelsRiseWithDifficulty) {
  const Difficulty order[] = {Difficulty::Normal, Difficulty::Nightmare,
                              Difficulty::Hell};
  for (EnemyTier tier : {EnemyTier::Normal, EnemyTier::Elite, EnemyTier::Boss}) {
    for (int i = 0; i + 1 < 3; ++i) {
      LevelRange lower = EntityPlacer::GetTierLevelRange(order[i], tier);
      LevelRange higher = EntityPlacer::GetTierLevelRange(order[i + 1], tier);
      EXPECT_LE(lower.max, higher.min);
    }
  }

  RandomStream rng(2);
  for (Difficulty difficulty : order) {
    for (EnemyTier tier :
         {EnemyTier::Normal, EnemyTier::Elite, EnemyTier::Boss}) {
      LevelRange band = EntityPlacer::GetTierLevelRange(difficulty, tier);
      for (int i = 0; i < 200; ++i) {
        int level = EntityPlacer::DetermineLevel(rng, difficulty, tier);
        EXPECT_GE(level, band.min);
        EXPECT_LT(level, band.max);
      }
    }
  }
}

TEST(EntityPlacerTest, TierBands) {
  LevelRange elite =
      EntityPlacer::GetTierLevelRange(Difficulty::Normal, EnemyTier::Elite);
  EXPECT_EQ(elite.min, 1);
  EXPECT_EQ(elite.max, 36);
  LevelRange boss =
      EntityPlacer::GetTierLevelRange(Difficulty::Nightmare, EnemyTier::Boss);
  EXPECT_EQ(boss.min, 60);
  EXPECT_EQ(boss.max, 90);
  EXPECT_DOUBLE_EQ(GetEliteChance(Difficulty::Hell), 0.25);
}
