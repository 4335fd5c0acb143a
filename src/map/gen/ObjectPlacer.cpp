#include "ObjectPlacer.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "SpawnTables.h"
#include <algorithm>
#include <cmath>

double ObjectPlacer::GetChestDensity(const MapOptions &options, MapType type) {
  return options.chestDensity *
         GetDifficultyScaling(options.difficultyLevel).chest *
         GetPlacementMultipliers(type).chest;
}

double ObjectPlacer::GetObstacleDensity(const MapOptions &options,
                                        MapType type) {
  return options.obstacleDensity *
         GetDifficultyScaling(options.difficultyLevel).obstacle *
         GetPlacementMultipliers(type).obstacle;
}

ObjectPlacementStats ObjectPlacer::Place(GenContext &ctx) {
  PROFILE_SCOPE("ObjectPlacer");

  ObjectPlacementStats stats;
  std::vector<glm::ivec2> pool = CollectCandidates(ctx);
  stats.candidates = pool.size();
  stats.chestDensity = GetChestDensity(ctx.options, ctx.mapType);
  stats.obstacleDensity = GetObstacleDensity(ctx.options, ctx.mapType);

  size_t chestQuota =
      (size_t)std::floor(stats.candidates * stats.chestDensity);
  size_t obstacleQuota =
      (size_t)std::floor(stats.candidates * stats.obstacleDensity);

  stats.chests = PlaceFromPool(ctx, pool, chestQuota, CellKind::Chest);
  stats.obstacles =
      PlaceFromPool(ctx, pool, obstacleQuota, CellKind::Obstacle);

  if (stats.chests < chestQuota || stats.obstacles < obstacleQuota) {
    LOG_GEN_DEBUG("ObjectPlacer: short of quota, chests {}/{} obstacles {}/{}",
                  stats.chests, chestQuota, stats.obstacles, obstacleQuota);
  }
  LOG_GEN_TRACE("ObjectPlacer: {} candidates, {} chests, {} obstacles",
                stats.candidates, stats.chests, stats.obstacles);
  return stats;
}

std::vector<glm::ivec2>
ObjectPlacer::CollectCandidates(const GenContext &ctx) const {
  std::vector<glm::ivec2> candidates;
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (ctx.IsWalkable(x, y) && !ctx.IsReserved(x, y))
        candidates.emplace_back(x, y);
    }
  }
  return candidates;
}

size_t ObjectPlacer::PlaceFromPool(GenContext &ctx,
                                   std::vector<glm::ivec2> &pool, size_t quota,
                                   CellKind kind) {
  size_t placed = 0;
  while (placed < quota && !pool.empty()) {
    size_t index = ctx.rng.NextIndex(pool.size());
    glm::ivec2 cell = pool[index];
    pool[index] = pool.back();
    pool.pop_back();

    // Cells that would cut a passage are dropped, not retried
    if (!ctx.CanBlock(cell.x, cell.y))
      continue;

    // Chests keep the floor height they land on, obstacles stand proud of it
    double h = ctx.GetHeight(cell.x, cell.y);
    if (kind == CellKind::Obstacle) {
      PlacementMultipliers m = GetPlacementMultipliers(ctx.mapType);
      h = ctx.rng.NextRange(m.obstacleHeightMin, m.obstacleHeightMax);
    }
    ctx.SetCell(cell.x, cell.y, kind, h);
    placed++;
  }
  return placed;
}
