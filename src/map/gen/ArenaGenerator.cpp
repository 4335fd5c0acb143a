#include "ArenaGenerator.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "../../utils/MathUtils.h"
#include "NoiseField.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace {
constexpr double kArenaRadiusRatio = 0.4;
constexpr double kBlendWidth = 5.0;
constexpr double kAltarRatio = 0.15;
constexpr int kEntranceLength = 10;
} // namespace

double ArenaGenerator::GetRadius(int width, int height) {
  return std::min(width, height) * kArenaRadiusRatio;
}

void ArenaGenerator::Generate(GenContext &ctx) {
  PROFILE_SCOPE("Arena");

  glm::ivec2 center = GetCenter(ctx.Width(), ctx.Height());
  double radius = GetRadius(ctx.Width(), ctx.Height());

  CarveArena(ctx, center, radius);
  int pillars = PlacePillars(ctx, center, radius);
  CarveAltar(ctx, center, radius);
  PlaceCoverWalls(ctx, center, radius, (int)std::floor(pillars * 1.5));
  CarveEntrance(ctx, center, radius);

  LOG_GEN_DEBUG("Arena {}x{}: radius {:.1f}, {} pillars", ctx.Width(),
                ctx.Height(), radius, pillars);
}

void ArenaGenerator::CarveArena(GenContext &ctx, glm::ivec2 center,
                                double radius) {
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      double d = MathUtils::Distance(center.x, center.y, x, y);
      if (d < radius) {
        double h = 0.4 + 0.05 * (1.0 - d / radius) +
                   ctx.noise.Sample2D((float)x, (float)y, 2.0f) * 0.05;
        ctx.SetCell(x, y, CellKind::Floor, std::max(kWalkableHeight, h));
      } else if (d < radius + kBlendWidth) {
        // Rises back toward the surrounding rock
        ctx.SetCell(x, y, CellKind::Floor,
                    0.4 + 0.3 * (d - radius) / kBlendWidth);
      } else {
        ctx.SetCell(x, y, CellKind::Wall,
                    0.7 + ctx.noise.Sample2D((float)x, (float)y) * 0.2);
      }
    }
  }
}

int ArenaGenerator::PlacePillars(GenContext &ctx, glm::ivec2 center,
                                 double radius) {
  RandomStream &rng = ctx.rng;
  int count = rng.NextInt(4, 11);

  for (int i = 0; i < count; ++i) {
    double angle = rng.NextAngle();
    double dist = radius * rng.NextRange(0.3, 0.8);
    glm::ivec2 p = MathUtils::PolarOffset(center.x, center.y, angle, dist);
    int size = rng.NextInt(1, 2);

    for (int y = p.y - size; y <= p.y + size; ++y) {
      for (int x = p.x - size; x <= p.x + size; ++x) {
        if (!ctx.model.InBounds(x, y) ||
            MathUtils::Distance(p.x, p.y, x, y) > size)
          continue;
        if (rng.Chance(0.7))
          ctx.SetCell(x, y, CellKind::Wall, rng.NextRange(0.7, 0.9));
        else
          ctx.SetCell(x, y, CellKind::Obstacle, rng.NextRange(0.5, 0.7));
      }
    }
  }
  return count;
}

void ArenaGenerator::CarveAltar(GenContext &ctx, glm::ivec2 center,
                                double radius) {
  int altar = (int)std::floor(radius * kAltarRatio);

  for (int y = center.y - altar; y <= center.y + altar; ++y) {
    for (int x = center.x - altar; x <= center.x + altar; ++x) {
      if (!ctx.model.InBounds(x, y))
        continue;
      double d = MathUtils::Distance(center.x, center.y, x, y);
      if (d > altar)
        continue;
      double rise = altar > 0 ? 1.0 - d / altar : 1.0;
      ctx.SetCell(x, y, CellKind::Floor, 0.5 + 0.2 * rise);
      ctx.Reserve(x, y);
    }
  }
}

void ArenaGenerator::PlaceCoverWalls(GenContext &ctx, glm::ivec2 center,
                                     double radius, int count) {
  RandomStream &rng = ctx.rng;

  for (int i = 0; i < count; ++i) {
    double angle = rng.NextAngle();
    double dist = radius * rng.NextRange(0.4, 0.8);
    glm::ivec2 p = MathUtils::PolarOffset(center.x, center.y, angle, dist);
    int half = rng.NextInt(1, 2);
    bool horizontal = rng.Chance(0.5);

    for (int k = -half; k <= half; ++k) {
      int x = horizontal ? p.x + k : p.x;
      int y = horizontal ? p.y : p.y + k;
      if (!ctx.model.InBounds(x, y) || ctx.GetKind(x, y) != CellKind::Floor)
        continue;
      if (!ctx.CanBlock(x, y))
        continue;
      ctx.SetCell(x, y, CellKind::Wall, rng.NextRange(0.6, 0.7));
    }
  }
}

void ArenaGenerator::CarveEntrance(GenContext &ctx, glm::ivec2 center,
                                   double radius) {
  double angle = ctx.rng.NextAngle();
  double dirX = std::cos(angle);
  double dirY = std::sin(angle);
  double perpX = std::sin(angle);
  double perpY = -std::cos(angle);

  glm::ivec2 start = MathUtils::PolarOffset(center.x, center.y, angle, radius);
  glm::ivec2 end((int)std::floor(start.x + dirX * kEntranceLength),
                 (int)std::floor(start.y + dirY * kEntranceLength));

  // Diagonal steps get a connector cell so the corridor stays 4-connected
  std::vector<glm::ivec2> steps;
  std::vector<glm::ivec2> line =
      MathUtils::LinePoints(start.x, start.y, end.x, end.y);
  for (size_t i = 0; i < line.size(); ++i) {
    if (i > 0 && line[i].x != line[i - 1].x && line[i].y != line[i - 1].y)
      steps.emplace_back(line[i].x, line[i - 1].y);
    steps.push_back(line[i]);
  }

  std::vector<glm::ivec2> corridor;
  std::set<std::pair<int, int>> corridorCells;
  for (const glm::ivec2 &c : steps) {
    if (!ctx.model.InBounds(c.x, c.y))
      continue;
    corridor.push_back(c);
    corridorCells.insert({c.x, c.y});
  }

  for (const glm::ivec2 &c : corridor) {
    double h = 0.4 + ctx.noise.Sample2D((float)c.x, (float)c.y) * 0.1;
    ctx.SetCell(c.x, c.y, CellKind::Floor, std::max(kWalkableHeight, h));
    ctx.Reserve(c.x, c.y);
  }

  // Flank walls never land on corridor cells
  for (const glm::ivec2 &c : corridor) {
    for (int side : {-1, 1}) {
      int wx = (int)std::floor(c.x + perpX * side);
      int wy = (int)std::floor(c.y + perpY * side);
      if (!ctx.model.InBounds(wx, wy) || corridorCells.count({wx, wy}) ||
          ctx.IsReserved(wx, wy))
        continue;
      ctx.SetCell(wx, wy, CellKind::Wall,
                  0.7 + ctx.noise.Sample2D((float)wx, (float)wy) * 0.2);
    }
  }
}
