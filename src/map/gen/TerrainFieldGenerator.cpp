#include "TerrainFieldGenerator.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "../../utils/MathUtils.h"
#include "NoiseField.h"
#include <cmath>

namespace {
constexpr double kWaterLevel = 0.3;
constexpr double kHighGround = 0.75;
constexpr double kDetailWeight = 0.2;
constexpr float kDetailFrequency = 4.0f;

// Fields keep fewer walls than dungeons
constexpr double kFieldWallScale = 0.5;
constexpr double kRockShare = 0.3;
} // namespace

void TerrainFieldGenerator::Generate(GenContext &ctx) {
  PROFILE_SCOPE("Field");

  GenerateBaseTerrain(ctx);

  RandomStream &rng = ctx.rng;
  const int w = ctx.Width();
  const int h = ctx.Height();

  int forests = rng.NextInt(3, 8);
  for (int i = 0; i < forests; ++i) {
    int cx = (int)rng.NextIndex((size_t)w);
    int cy = (int)rng.NextIndex((size_t)h);
    int radius = rng.NextInt(5, 19);
    CreateForest(ctx, cx, cy, radius);
  }

  int lakes = rng.NextInt(1, 4);
  for (int i = 0; i < lakes; ++i) {
    int cx = (int)rng.NextIndex((size_t)w);
    int cy = (int)rng.NextIndex((size_t)h);
    int radius = rng.NextInt(8, 22);
    CreateLake(ctx, cx, cy, radius);
  }

  PlaceNaturalObstacles(ctx);

  // Paths go last so they cut through forests and lakes
  int paths = rng.NextInt(2, 6);
  for (int i = 0; i < paths; ++i) {
    int x0 = (int)rng.NextIndex((size_t)w);
    int y0 = (int)rng.NextIndex((size_t)h);
    int x1 = (int)rng.NextIndex((size_t)w);
    int y1 = (int)rng.NextIndex((size_t)h);
    CreatePath(ctx, x0, y0, x1, y1);
  }

  LOG_GEN_DEBUG("Field {}x{}: {} forests, {} lakes, {} paths", w, h, forests,
                lakes, paths);
}

void TerrainFieldGenerator::GenerateBaseTerrain(GenContext &ctx) {
  PROFILE_SCOPE("Field::Terrain");
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      double base = ctx.noise.Sample2D((float)x, (float)y);
      double detail = ctx.noise.Sample2D((float)x, (float)y, kDetailFrequency);
      double height = MathUtils::Clamp01(
          ((base + kDetailWeight * detail) / (1.0 + kDetailWeight)) * 0.5 +
          0.5);

      CellKind kind = CellKind::Floor;
      if (height < kWaterLevel)
        kind = CellKind::Water;
      else if (height > kHighGround)
        kind = CellKind::Wall;
      ctx.SetCell(x, y, kind, height);
    }
  }
}

void TerrainFieldGenerator::CreateForest(GenContext &ctx, int cx, int cy,
                                         int radius) {
  RandomStream &rng = ctx.rng;
  double density = rng.NextRange(0.6, 0.9);

  for (int y = cy - radius; y <= cy + radius; ++y) {
    for (int x = cx - radius; x <= cx + radius; ++x) {
      if (!ctx.model.InBounds(x, y))
        continue;
      double d = MathUtils::Distance(cx, cy, x, y);
      if (d > radius)
        continue;

      if (rng.Chance(density * (1.0 - d / radius)))
        ctx.SetCell(x, y, CellKind::Wall, rng.NextRange(0.6, 0.9));
      else
        ctx.SetCell(x, y, CellKind::Floor, rng.NextRange(0.4, 0.5));
    }
  }
}

void TerrainFieldGenerator::CreateLake(GenContext &ctx, int cx, int cy,
                                       int radius) {
  for (int y = cy - radius; y <= cy + radius; ++y) {
    for (int x = cx - radius; x <= cx + radius; ++x) {
      if (!ctx.model.InBounds(x, y))
        continue;
      double dx = x - cx;
      double dy = y - cy;
      // Stretched along x
      double d = std::sqrt(dx * dx / 1.5 + dy * dy);
      if (d > radius)
        continue;
      ctx.SetCell(x, y, CellKind::Water, 0.2 - 0.1 * d / radius);
    }
  }
}

void TerrainFieldGenerator::PlaceNaturalObstacles(GenContext &ctx) {
  PROFILE_SCOPE("Field::Obstacles");
  RandomStream &rng = ctx.rng;
  const double chance = ctx.options.wallDensity * kFieldWallScale * 2.0;
  const int dirs[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (ctx.GetKind(x, y) != CellKind::Floor || !rng.Chance(chance))
        continue;

      int open = 0;
      for (const auto &d : dirs) {
        if (ctx.model.InBounds(x + d[0], y + d[1]) &&
            ctx.GetKind(x + d[0], y + d[1]) == CellKind::Floor)
          open++;
      }
      if (open < 2 || !ctx.CanBlock(x, y))
        continue;

      if (rng.Chance(kRockShare))
        ctx.SetCell(x, y, CellKind::Wall, rng.NextRange(0.6, 0.8));
      else
        ctx.SetCell(x, y, CellKind::Obstacle, rng.NextRange(0.5, 0.6));
    }
  }
}

void TerrainFieldGenerator::CreatePath(GenContext &ctx, int x0, int y0, int x1,
                                       int y1) {
  int width = ctx.rng.NextInt(1, 2);

  for (const glm::ivec2 &p : MathUtils::LinePoints(x0, y0, x1, y1)) {
    for (int dy = -width; dy <= width; ++dy) {
      for (int dx = -width; dx <= width; ++dx) {
        int nx = p.x + dx;
        int ny = p.y + dy;
        if (!ctx.model.InBounds(nx, ny))
          continue;
        double d = std::sqrt((double)(dx * dx + dy * dy));
        if (d > width)
          continue;
        ctx.SetCell(nx, ny, CellKind::Floor,
                    0.4 - (d / width) * 0.05);
      }
    }
  }
}
