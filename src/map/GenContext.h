#ifndef GEN_CONTEXT_H
#define GEN_CONTEXT_H

#include "../utils/Grid.h"
#include "../utils/RandomStream.h"
#include "MapModel.h"
#include "MapOptions.h"

class NoiseField;

/**
 * GenContext is the shared state handed to every stage of one generation run.
 * It owns nothing except the reserved-cell mask:
 *   - options, random stream and noise come from MapGenerator
 *   - model is the map being built, written in place by each stage
 */
class GenContext {
public:
  GenContext(const MapOptions &options, MapType mapType, RandomStream &rng,
             const NoiseField &noise, MapModel &model);

  const MapOptions &options;
  const MapType mapType;
  RandomStream &rng;
  const NoiseField &noise;
  MapModel &model;

  int Width() const { return model.width; }
  int Height() const { return model.height; }

  /**
   * Write kind and height of one cell. Out-of-bounds writes are ignored.
   */
  void SetCell(int x, int y, CellKind kind, double height);
  void SetKind(int x, int y, CellKind kind);
  void SetHeight(int x, int y, double height);

  CellKind GetKind(int x, int y) const {
    return model.placementGrid.Get(x, y, CellKind::Wall);
  }
  double GetHeight(int x, int y) const { return model.heightMap.Get(x, y); }

  bool IsWalkable(int x, int y) const { return model.IsWalkable(x, y); }

  /**
   * Reserved cells (doors, gates, altar, room centres) are never blocked by
   * later passes.
   */
  void Reserve(int x, int y) { reserved.Set(x, y, true); }
  bool IsReserved(int x, int y) const { return reserved.Get(x, y, false); }
  const Grid<bool> &GetReserved() const { return reserved; }

  /**
   * True if (x, y) may become a blocker: in bounds, not reserved, and its
   * walkable neighbours stay connected around it.
   */
  bool CanBlock(int x, int y) const;

private:
  Grid<bool> reserved;
};

#endif
