#include "TestHelpers.h"
#include "map/MapGenerator.h"
#include "map/gen/SpawnTables.h"
#include "map/gen/TownGenerator.h"
#include "utils/MathUtils.h"
#include <gtest/gtest.h>
#include <set>

namespace {
const uint32_t kTownSeeds[] = {1u, 8u, 64u, 512u, 4096u};
} // namespace

// ============================================================================
// Town layout
// ============================================================================

TEST(TownTest, BuildingsAreDisjointAndReachable) {
  MapGenerator generator;
  for (uint32_t seed : kTownSeeds) {
    MapModel model =
        generator.GenerateMap(MapType::Town, MakeOptions(100, 100, seed));
    EXPECT_GE(model.rooms.size(), 1u) << "seed " << seed;
    EXPECT_LE(model.rooms.size(), 14u) << "seed " << seed;
    EXPECT_TRUE(RoomsDisjoint(model)) << "seed " << seed;
    EXPECT_TRUE(AllDoorsConnected(model)) << "seed " << seed;
  }
}

TEST(TownTest, FirstBuildingsAreShops) {
  MapModel model =
      MapGenerator().GenerateMap(MapType::Town, MakeOptions(100, 100, 8));
  size_t shops = std::min<size_t>(3, model.rooms.size());
  for (size_t i = 0; i < model.rooms.size(); ++i)
    EXPECT_EQ(model.rooms[i].isShop, i < shops) << "building " << i;
}

TEST(TownTest, BuildingsHaveWallsAndOneDoor) {
  MapModel model =
      MapGenerator().GenerateMap(MapType::Town, MakeOptions(100, 100, 64));
  for (const Room &room : model.rooms) {
    EXPECT_GE(room.width, 5);
    EXPECT_LE(room.width, 9);
    EXPECT_GE(room.height, 5);
    EXPECT_LE(room.height, 9);

    int openings = 0;
    int x1 = room.x + room.width - 1;
    int y1 = room.y + room.height - 1;
    for (int y = room.y; y <= y1; ++y) {
      for (int x = room.x; x <= x1; ++x) {
        bool outline = x == room.x || x == x1 || y == room.y || y == y1;
        if (outline && model.placementGrid(x, y) != CellKind::Wall)
          openings++;
      }
    }
    EXPECT_EQ(openings, 1);
    EXPECT_TRUE(model.IsWalkable(room.doorX, room.doorY));
    EXPECT_TRUE(model.IsWalkable(room.centerX, room.centerY));
  }
}

TEST(TownTest, GatesOpenThroughPerimeter) {
  MapModel model =
      MapGenerator().GenerateMap(MapType::Town, MakeOptions(100, 100, 512));
  PathfindingGrid grid(model);
  AStarPathfinder pathfinder(grid);

  // Gates sit where the perimeter ring crosses the centre lines
  const int radius = 45;
  EXPECT_TRUE(model.IsWalkable(50, 50 - radius));
  EXPECT_TRUE(model.IsWalkable(50 + radius, 50));
  ASSERT_FALSE(model.rooms.empty());
  EXPECT_TRUE(pathfinder
                  .FindPath(model.rooms[0].doorX, model.rooms[0].doorY, 50,
                            50 - radius)
                  .has_value());
}

// ============================================================================
// Town NPCs
// ============================================================================

TEST(TownTest, ShopkeepersCarryStock) {
  MapGenerator generator;
  for (uint32_t seed : kTownSeeds) {
    MapModel model =
        generator.GenerateMap(MapType::Town, MakeOptions(100, 100, seed));
    size_t shopRooms = 0;
    for (const Room &room : model.rooms)
      shopRooms += room.isShop ? 1 : 0;

    size_t shopNpcs = 0;
    for (const NpcSpawn &npc : model.npcSpawns) {
      EXPECT_TRUE(model.IsWalkable(npc.x, npc.y)) << "seed " << seed;
      if (!npc.isShop)
        continue;
      shopNpcs++;
      ASSERT_TRUE(npc.shopKind.has_value());
      ASSERT_TRUE(npc.shopItems.has_value());
      EXPECT_GE(npc.shopItems->size(), 5u);
      EXPECT_LE(npc.shopItems->size(), 14u);
      for (const ShopItem &item : *npc.shopItems) {
        EXPECT_GE(item.price, 10);
        EXPECT_LE(item.price, 1009);
        EXPECT_EQ(item.id.rfind("item_", 0), 0u);
      }
      EXPECT_EQ(npc.dialogueLines, GetShopGreetings());
    }
    EXPECT_EQ(shopNpcs, shopRooms) << "seed " << seed;
  }
}

TEST(TownTest, TownsfolkHaveDistinctLines) {
  MapGenerator generator;
  for (uint32_t seed : kTownSeeds) {
    MapModel model =
        generator.GenerateMap(MapType::Town, MakeOptions(100, 100, seed));
    for (const NpcSpawn &npc : model.npcSpawns) {
      if (npc.isShop)
        continue;
      EXPECT_FALSE(npc.shopItems.has_value());
      EXPECT_GE(npc.dialogueLines.size(), 2u);
      EXPECT_LE(npc.dialogueLines.size(), 5u);
      std::set<std::string> unique(npc.dialogueLines.begin(),
                                   npc.dialogueLines.end());
      EXPECT_EQ(unique.size(), npc.dialogueLines.size());
    }
  }
}

TEST(TownTest, OutdoorNpcsStayInTown) {
  MapOptions options = MakeOptions(100, 100, 4096);
  options.npcDensity = 0.05f;
  MapModel model = MapGenerator().GenerateMap(MapType::Town, options);
  double radius = TownGenerator::GetTownRadius(100, 100);

  std::set<std::pair<int, int>> cells;
  for (const NpcSpawn &npc : model.npcSpawns) {
    EXPECT_TRUE(cells.insert({npc.x, npc.y}).second)
        << "two NPCs at " << npc.x << "," << npc.y;
    bool indoors = false;
    for (const Room &room : model.rooms)
      indoors = indoors || room.Contains(npc.x, npc.y);
    if (!indoors)
      EXPECT_LT(MathUtils::Distance(50, 50, npc.x, npc.y), radius);
  }
  EXPECT_GT(model.npcSpawns.size(), model.rooms.size());
}

TEST(TownTest, OnlyTownsGetNpcs) {
  MapGenerator generator;
  for (MapType type : {MapType::Dungeon, MapType::Field, MapType::Arena}) {
    MapModel model = generator.GenerateMap(type, MakeOptions(60, 60, 2));
    EXPECT_TRUE(model.npcSpawns.empty()) << ToString(type);
  }
}
