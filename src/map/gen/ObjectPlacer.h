#ifndef OBJECT_PLACER_H
#define OBJECT_PLACER_H

#include "../GenContext.h"
#include <glm/glm.hpp>
#include <vector>

struct ObjectPlacementStats {
  size_t candidates = 0;
  double chestDensity = 0.0;
  double obstacleDensity = 0.0;
  size_t chests = 0;
  size_t obstacles = 0;
};

// Chests and obstacles on finished terrain. Quotas are taken from the
// candidate count so realised totals track the effective densities.
class ObjectPlacer {
public:
  ObjectPlacementStats Place(GenContext &ctx);

  static double GetChestDensity(const MapOptions &options, MapType type);
  static double GetObstacleDensity(const MapOptions &options, MapType type);

private:
  std::vector<glm::ivec2> CollectCandidates(const GenContext &ctx) const;
  size_t PlaceFromPool(GenContext &ctx, std::vector<glm::ivec2> &pool,
                       size_t quota, CellKind kind);
};

#endif
