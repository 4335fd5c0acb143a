#ifndef ASTAR_PATHFINDER_H
#define ASTAR_PATHFINDER_H

#include "PathfindingGrid.h"
#include <glm/glm.hpp>
#include <optional>
#include <vector>

// 4-directional A* with unit step cost and a Manhattan heuristic.
// Queries are const reads of the grid, safe to run concurrently while the
// grid itself is not being modified.
class AStarPathfinder {
public:
  // maxExpansions 0 means unlimited
  explicit AStarPathfinder(const PathfindingGrid &grid,
                           size_t maxExpansions = 0);

  // Path from start to end inclusive of both. nullopt if an endpoint is out
  // of bounds, the end is blocked, the goal is unreachable or the expansion
  // limit is hit.
  std::optional<std::vector<glm::ivec2>> FindPath(int startX, int startY,
                                                  int endX, int endY) const;

  void SetMaxExpansions(size_t limit) { maxExpansions = limit; }
  size_t GetMaxExpansions() const { return maxExpansions; }

private:
  const PathfindingGrid &grid;
  size_t maxExpansions;
};

#endif
