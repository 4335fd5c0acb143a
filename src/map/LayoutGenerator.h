#ifndef LAYOUT_GENERATOR_H
#define LAYOUT_GENERATOR_H

#include "GenContext.h"

// Shapes the terrain of one map type: fills heightMap and placementGrid,
// records rooms and reserves cells that later passes must keep open.
class LayoutGenerator {
public:
  virtual ~LayoutGenerator() {}
  virtual void Generate(GenContext &ctx) = 0;
};

#endif
