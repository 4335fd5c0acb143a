#ifndef ARENA_GENERATOR_H
#define ARENA_GENERATOR_H

#include "../LayoutGenerator.h"
#include <glm/glm.hpp>

// Boss arena: an open disc inside solid rock with pillars and short cover
// walls, a raised altar in the middle and one corridor leading out.
class ArenaGenerator : public LayoutGenerator {
public:
  void Generate(GenContext &ctx) override;

  // Centre cell shared with the boss placement
  static glm::ivec2 GetCenter(int width, int height) {
    return glm::ivec2(width / 2, height / 2);
  }
  static double GetRadius(int width, int height);

private:
  void CarveArena(GenContext &ctx, glm::ivec2 center, double radius);
  int PlacePillars(GenContext &ctx, glm::ivec2 center, double radius);
  void CarveAltar(GenContext &ctx, glm::ivec2 center, double radius);
  void PlaceCoverWalls(GenContext &ctx, glm::ivec2 center, double radius,
                       int count);
  void CarveEntrance(GenContext &ctx, glm::ivec2 center, double radius);
};

#endif
