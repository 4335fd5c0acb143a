#include "AStarPathfinder.h"
#include "../debug/Logger.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <queue>

namespace {
struct OpenNode {
  int f;
  uint64_t seq; // insertion order, earlier wins on equal f
  int index;
};

struct OpenCmp {
  bool operator()(const OpenNode &a, const OpenNode &b) const {
    // min-heap via priority_queue (reverse comparator)
    if (a.f != b.f)
      return a.f > b.f;
    return a.seq > b.seq;
  }
};

int Manhattan(int x0, int y0, int x1, int y1) {
  return std::abs(x1 - x0) + std::abs(y1 - y0);
}
} // namespace

AStarPathfinder::AStarPathfinder(const PathfindingGrid &grid,
                                 size_t maxExpansions)
    : grid(grid), maxExpansions(maxExpansions) {}

std::optional<std::vector<glm::ivec2>>
AStarPathfinder::FindPath(int startX, int startY, int endX, int endY) const {
  if (!grid.InBounds(startX, startY) || !grid.InBounds(endX, endY))
    return std::nullopt;
  if (!grid.IsWalkable(endX, endY))
    return std::nullopt;

  const int w = grid.GetWidth();
  const size_t n = static_cast<size_t>(w) * grid.GetHeight();
  constexpr int kInf = std::numeric_limits<int>::max();

  std::vector<int> gCost(n, kInf);
  std::vector<int> parent(n, -1);
  std::vector<uint8_t> closed(n, 0);
  // First insertion order per cell, reused when its cost improves
  std::vector<uint64_t> liveSeq(n, 0);

  const int startIdx = startY * w + startX;
  const int goalIdx = endY * w + endX;

  std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCmp> open;
  uint64_t nextSeq = 1;

  gCost[startIdx] = 0;
  liveSeq[startIdx] = nextSeq;
  open.push({Manhattan(startX, startY, endX, endY), nextSeq++, startIdx});

  size_t expanded = 0;
  // Up, right, down, left
  const int dx[4] = {0, 1, 0, -1};
  const int dy[4] = {-1, 0, 1, 0};

  while (!open.empty()) {
    OpenNode top = open.top();
    open.pop();

    // Superseded entries carry a higher f and surface after the cell closed
    if (closed[top.index])
      continue;

    if (top.index == goalIdx) {
      std::vector<glm::ivec2> path;
      for (int p = goalIdx; p != -1; p = parent[p])
        path.emplace_back(p % w, p / w);
      std::reverse(path.begin(), path.end());
      return path;
    }

    closed[top.index] = 1;
    if (maxExpansions > 0 && ++expanded > maxExpansions) {
      LOG_NAV_DEBUG("FindPath ({},{})->({},{}) gave up after {} expansions",
                    startX, startY, endX, endY, maxExpansions);
      return std::nullopt;
    }

    const int px = top.index % w;
    const int py = top.index / w;
    for (int i = 0; i < 4; ++i) {
      const int nx = px + dx[i];
      const int ny = py + dy[i];
      if (!grid.IsWalkable(nx, ny))
        continue;

      const int nIdx = ny * w + nx;
      if (closed[nIdx])
        continue;

      const int tentative = gCost[top.index] + 1;
      if (tentative >= gCost[nIdx])
        continue;

      gCost[nIdx] = tentative;
      parent[nIdx] = top.index;
      // Improved entries keep their first insertion order
      if (liveSeq[nIdx] == 0)
        liveSeq[nIdx] = nextSeq++;
      open.push({tentative + Manhattan(nx, ny, endX, endY), liveSeq[nIdx],
                 nIdx});
    }
  }

  return std::nullopt;
}
