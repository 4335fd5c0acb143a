#include "PathfindingGrid.h"
#include "../debug/Logger.h"

namespace {
constexpr int kRandomProbes = 100;
constexpr int kCenterWindowRadius = 5;
} // namespace

PathfindingGrid::PathfindingGrid(const MapModel &model)
    : cells(model.width, model.height, false) {
  for (int y = 0; y < model.height; ++y) {
    for (int x = 0; x < model.width; ++x)
      cells(x, y) = model.IsWalkable(x, y);
  }
}

PathfindingGrid::PathfindingGrid(int width, int height, bool walkable)
    : cells(width, height, walkable) {}

bool PathfindingGrid::SetWalkable(int x, int y, bool walkable) {
  return cells.Set(x, y, walkable);
}

size_t PathfindingGrid::CountWalkable() const {
  size_t count = 0;
  for (bool walkable : cells.Data()) {
    if (walkable)
      count++;
  }
  return count;
}

glm::ivec2 PathfindingGrid::GetRandomWalkablePosition(RandomStream &rng) const {
  const int w = GetWidth();
  const int h = GetHeight();
  if (w == 0 || h == 0) {
    LOG_NAV_WARN("GetRandomWalkablePosition on an empty grid, using (0, 0)");
    return glm::ivec2(0, 0);
  }

  for (int i = 0; i < kRandomProbes; ++i) {
    int x = (int)rng.NextIndex((size_t)w);
    int y = (int)rng.NextIndex((size_t)h);
    if (IsWalkable(x, y))
      return glm::ivec2(x, y);
  }

  const int cx = w / 2;
  const int cy = h / 2;
  for (int y = cy - kCenterWindowRadius; y <= cy + kCenterWindowRadius; ++y) {
    for (int x = cx - kCenterWindowRadius; x <= cx + kCenterWindowRadius;
         ++x) {
      if (IsWalkable(x, y))
        return glm::ivec2(x, y);
    }
  }

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      if (IsWalkable(x, y))
        return glm::ivec2(x, y);
    }
  }

  LOG_NAV_WARN("No walkable cell in {}x{} grid, using (0, 0)", w, h);
  return glm::ivec2(0, 0);
}
