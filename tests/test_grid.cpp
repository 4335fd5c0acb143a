#include "map/GenContext.h"
#include "map/gen/NoiseField.h"
#include "utils/Grid.h"
#include "utils/GridUtils.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <set>
#include <utility>

// ============================================================================
// Grid Tests
// ============================================================================

TEST(GridTest, ConstructAndFill) {
  Grid<int> grid(4, 3, 7);
  EXPECT_EQ(grid.GetWidth(), 4);
  EXPECT_EQ(grid.GetHeight(), 3);
  EXPECT_EQ(grid.Size(), 12u);
  for (int v : grid.Data())
    EXPECT_EQ(v, 7);

  grid.Fill(2);
  EXPECT_EQ(grid(3, 2), 2);
}

TEST(GridTest, RowMajorColumnX) {
  Grid<int> grid(5, 2, 0);
  grid(3, 1) = 42;
  // index = y * width + x
  EXPECT_EQ(grid.Data()[1 * 5 + 3], 42);
}

TEST(GridTest, CheckedAccessOutsideBounds) {
  Grid<int> grid(3, 3, 1);
  EXPECT_FALSE(grid.InBounds(-1, 0));
  EXPECT_FALSE(grid.InBounds(3, 0));
  EXPECT_FALSE(grid.InBounds(0, 3));
  EXPECT_EQ(grid.Get(-1, -1, 99), 99);
  EXPECT_FALSE(grid.Set(3, 3, 5));
  EXPECT_TRUE(grid.Set(2, 2, 5));
  EXPECT_EQ(grid.Get(2, 2), 5);
}

TEST(GridTest, NegativeSizeIsEmpty) {
  Grid<int> grid(-3, 4, 0);
  EXPECT_TRUE(grid.Empty());
  EXPECT_EQ(grid.GetWidth(), 0);
  EXPECT_FALSE(grid.InBounds(0, 0));
}

TEST(GridTest, Equality) {
  Grid<int> a(2, 2, 0);
  Grid<int> b(2, 2, 0);
  EXPECT_EQ(a, b);
  b(1, 0) = 1;
  EXPECT_NE(a, b);
  EXPECT_NE(a, Grid<int>(4, 1, 0));
}

// ============================================================================
// Local connectivity guard
// ============================================================================

namespace {
// Walkable cells listed as offsets from the probe cell at (0, 0)
WalkableFn OpenCells(std::set<std::pair<int, int>> cells) {
  return [cells](int x, int y) { return cells.count({x, y}) > 0; };
}
} // namespace

TEST(ConnectivityTest, CorridorCellIsNotBlockable) {
  EXPECT_FALSE(KeepsLocalConnectivity(0, 0, OpenCells({{-1, 0}, {1, 0}})));
  EXPECT_FALSE(KeepsLocalConnectivity(0, 0, OpenCells({{0, -1}, {0, 1}})));
}

TEST(ConnectivityTest, OpenAreaIsBlockable) {
  std::set<std::pair<int, int>> all;
  for (int i = 0; i < 8; ++i)
    all.insert({kRingDX[i], kRingDY[i]});
  EXPECT_TRUE(KeepsLocalConnectivity(0, 0, OpenCells(all)));
}

TEST(ConnectivityTest, DeadEndIsBlockable) {
  EXPECT_TRUE(KeepsLocalConnectivity(0, 0, OpenCells({{-1, 0}})));
  EXPECT_TRUE(KeepsLocalConnectivity(0, 0, OpenCells({})));
}

TEST(ConnectivityTest, CornerNeedsDiagonal) {
  EXPECT_TRUE(
      KeepsLocalConnectivity(0, 0, OpenCells({{-1, 0}, {0, -1}, {-1, -1}})));
  EXPECT_FALSE(KeepsLocalConnectivity(0, 0, OpenCells({{-1, 0}, {0, -1}})));
}

TEST(ConnectivityTest, DiagonalOnlyNeighboursDoNotCount) {
  // Diagonal cells are not reachable 4-way from the probe anyway
  EXPECT_TRUE(KeepsLocalConnectivity(0, 0, OpenCells({{-1, -1}, {1, 1}})));
}

TEST(ConnectivityTest, RingSlotsAreOrthogonallyChained) {
  for (int i = 0; i < 8; ++i) {
    int j = (i + 1) % 8;
    int step = std::abs(kRingDX[i] - kRingDX[j]) +
               std::abs(kRingDY[i] - kRingDY[j]);
    EXPECT_EQ(step, 1) << "slots " << i << " and " << j;
    EXPECT_EQ(IsOrthogonalRingSlot(i), kRingDX[i] == 0 || kRingDY[i] == 0);
  }
}

// ============================================================================
// GenContext Tests
// ============================================================================

TEST(GenContextTest, CanBlockRespectsReservedAndBounds) {
  MapOptions options;
  options.width = 5;
  options.height = 5;
  MapModel model;
  model.width = 5;
  model.height = 5;
  model.heightMap = Grid<double>(5, 5, 0.5);
  model.placementGrid = Grid<CellKind>(5, 5, CellKind::Floor);

  RandomStream rng(1);
  NoiseField noise(1, 0.1f);
  GenContext ctx(options, MapType::Dungeon, rng, noise, model);

  EXPECT_TRUE(ctx.CanBlock(2, 2));
  ctx.Reserve(2, 2);
  EXPECT_TRUE(ctx.IsReserved(2, 2));
  EXPECT_FALSE(ctx.CanBlock(2, 2));
  EXPECT_FALSE(ctx.CanBlock(-1, 2));
  EXPECT_FALSE(ctx.IsReserved(9, 9));
}

TEST(GenContextTest, CanBlockFollowsTerrain) {
  MapOptions options;
  MapModel model;
  model.width = 5;
  model.height = 3;
  model.heightMap = Grid<double>(5, 3, 0.5);
  model.placementGrid = Grid<CellKind>(5, 3, CellKind::Wall);
  RandomStream rng(1);
  NoiseField noise(1, 0.1f);
  GenContext ctx(options, MapType::Dungeon, rng, noise, model);

  // One-wide corridor along y = 1
  for (int x = 0; x < 5; ++x)
    ctx.SetKind(x, 1, CellKind::Floor);
  EXPECT_FALSE(ctx.CanBlock(2, 1));
  EXPECT_TRUE(ctx.CanBlock(0, 1));

  // Low ground counts as blocked even on floor
  ctx.SetHeight(1, 1, 0.1);
  EXPECT_FALSE(ctx.IsWalkable(1, 1));
  EXPECT_TRUE(ctx.CanBlock(2, 1));

  EXPECT_EQ(ctx.GetKind(-1, 0), CellKind::Wall);
  ctx.SetCell(7, 7, CellKind::Floor, 1.0);
  EXPECT_EQ(model.CountCells(CellKind::Floor), 5u);
}
