#ifndef PATHFINDING_GRID_H
#define PATHFINDING_GRID_H

#include "../map/MapModel.h"
#include "../utils/Grid.h"
#include "../utils/RandomStream.h"
#include <glm/glm.hpp>

// Walkable/blocked snapshot of a MapModel. Rebuild it when the model is
// replaced; single cells can be toggled for doors, props and the like.
class PathfindingGrid {
public:
  PathfindingGrid() = default;
  explicit PathfindingGrid(const MapModel &model);
  PathfindingGrid(int width, int height, bool walkable = true);

  int GetWidth() const { return cells.GetWidth(); }
  int GetHeight() const { return cells.GetHeight(); }
  bool InBounds(int x, int y) const { return cells.InBounds(x, y); }

  // False outside the grid
  bool IsWalkable(int x, int y) const { return cells.Get(x, y, false); }
  bool SetWalkable(int x, int y, bool walkable);

  size_t CountWalkable() const;

  // Up to 100 random probes, then the 11x11 window around the centre, then a
  // full scan. Falls back to (0, 0) when nothing is walkable.
  glm::ivec2 GetRandomWalkablePosition(RandomStream &rng) const;

private:
  Grid<bool> cells;
};

#endif
