#include "GenContext.h"
#include "../utils/GridUtils.h"

GenContext::GenContext(const MapOptions &options, MapType mapType,
                       RandomStream &rng, const NoiseField &noise,
                       MapModel &model)
    : options(options), mapType(mapType), rng(rng), noise(noise),
      model(model), reserved(model.width, model.height, false) {}

void GenContext::SetCell(int x, int y, CellKind kind, double height) {
  if (!model.InBounds(x, y))
    return;
  model.placementGrid(x, y) = kind;
  model.heightMap(x, y) = height;
}

void GenContext::SetKind(int x, int y, CellKind kind) {
  model.placementGrid.Set(x, y, kind);
}

void GenContext::SetHeight(int x, int y, double height) {
  model.heightMap.Set(x, y, height);
}

bool GenContext::CanBlock(int x, int y) const {
  if (!model.InBounds(x, y) || IsReserved(x, y))
    return false;
  return KeepsLocalConnectivity(
      x, y, [this](int nx, int ny) { return model.IsWalkable(nx, ny); });
}
