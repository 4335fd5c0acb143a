#ifndef TOWN_GENERATOR_H
#define TOWN_GENERATOR_H

#include "../LayoutGenerator.h"
#include <glm/glm.hpp>

// Town: walled buildings with one door each around a central plaza, roads,
// a perimeter wall with four gates and a few decorations.
class TownGenerator : public LayoutGenerator {
public:
  void Generate(GenContext &ctx) override;

  // Free-roaming NPCs stay within this radius of the centre
  static double GetTownRadius(int width, int height);

private:
  void PlaceBuildings(GenContext &ctx, glm::ivec2 center);
  bool TryPlaceBuilding(GenContext &ctx, glm::ivec2 center, bool isShop);
  void BuildBuilding(GenContext &ctx, Room &room);
  void FurnishInterior(GenContext &ctx, const Room &room);
  void CarvePlaza(GenContext &ctx, glm::ivec2 center, int plazaRadius);
  void CarveRoads(GenContext &ctx, glm::ivec2 center);
  void CarveRoad(GenContext &ctx, int x0, int y0, int x1, int y1);
  void BuildPerimeterWall(GenContext &ctx, glm::ivec2 center);
  void AddDecorations(GenContext &ctx, glm::ivec2 center, int plazaRadius);

  bool InsideAnyBuilding(const GenContext &ctx, int x, int y) const;
};

#endif
