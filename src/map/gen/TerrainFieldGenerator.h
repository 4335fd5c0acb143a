#ifndef TERRAIN_FIELD_GENERATOR_H
#define TERRAIN_FIELD_GENERATOR_H

#include "../LayoutGenerator.h"

// Open field: noise heights with water and high ground, then forests, lakes,
// scattered rocks and brush, and finally paths cut through all of it.
class TerrainFieldGenerator : public LayoutGenerator {
public:
  void Generate(GenContext &ctx) override;

private:
  void GenerateBaseTerrain(GenContext &ctx);
  void CreateForest(GenContext &ctx, int cx, int cy, int radius);
  void CreateLake(GenContext &ctx, int cx, int cy, int radius);
  void PlaceNaturalObstacles(GenContext &ctx);
  void CreatePath(GenContext &ctx, int x0, int y0, int x1, int y1);
};

#endif
