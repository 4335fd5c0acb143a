#pragma once

#include <functional>

// Small grid helpers shared by the layout and placement passes.

using WalkableFn = std::function<bool(int x, int y)>;

// 8-neighbour ring in circular order. Consecutive entries are orthogonally
// adjacent to each other, so a run of open ring cells is 4-connected.
constexpr int kRingDX[8] = {-1, 0, 1, 1, 1, 0, -1, -1};
constexpr int kRingDY[8] = {-1, -1, -1, 0, 1, 1, 1, 0};

inline bool IsOrthogonalRingSlot(int i) { return (i & 1) == 1; }

// True if (x, y) can be turned into a blocker without cutting its walkable
// orthogonal neighbours off from one another. They must all sit in a single
// run of open cells around the ring. Cells outside the map count as blocked
// (the callback is expected to return false for them).
inline bool KeepsLocalConnectivity(int x, int y, const WalkableFn &walkable) {
  bool open[8];
  int firstClosed = -1;
  for (int i = 0; i < 8; ++i) {
    open[i] = walkable(x + kRingDX[i], y + kRingDY[i]);
    if (!open[i] && firstClosed < 0)
      firstClosed = i;
  }

  // Whole ring open
  if (firstClosed < 0)
    return true;

  int runsWithOrthogonal = 0;
  bool inRun = false;
  bool runHasOrthogonal = false;
  for (int step = 1; step <= 8; ++step) {
    int i = (firstClosed + step) % 8;
    if (open[i]) {
      inRun = true;
      if (IsOrthogonalRingSlot(i))
        runHasOrthogonal = true;
    } else if (inRun) {
      if (runHasOrthogonal)
        runsWithOrthogonal++;
      inRun = false;
      runHasOrthogonal = false;
    }
  }
  // The walk ends on firstClosed, which closes the last run

  return runsWithOrthogonal <= 1;
}
