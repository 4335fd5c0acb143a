#ifndef MAP_GENERATOR_H
#define MAP_GENERATOR_H

#include "MapModel.h"
#include "MapOptions.h"
#include <memory>

class LayoutGenerator;

// Entry point for map generation. Each call owns its own random stream and
// noise, so separate generator instances can run on separate threads.
class MapGenerator {
public:
  MapGenerator() = default;

  // Sanitises a copy of options, shapes the terrain for the requested type,
  // then places objects and entities. Never fails: degenerate options give
  // smaller or emptier maps.
  MapModel GenerateMap(MapType type, const MapOptions &options) const;

  static std::unique_ptr<LayoutGenerator> CreateLayout(MapType type);
};

#endif
