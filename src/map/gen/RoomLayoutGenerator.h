#ifndef ROOM_LAYOUT_GENERATOR_H
#define ROOM_LAYOUT_GENERATOR_H

#include "../LayoutGenerator.h"

// Dungeon: rectangular rooms joined by L-shaped corridors, walls everywhere
// else.
class RoomLayoutGenerator : public LayoutGenerator {
public:
  void Generate(GenContext &ctx) override;

private:
  void PlaceRooms(GenContext &ctx);
  void ConnectRooms(GenContext &ctx);
  void CarveLCorridor(GenContext &ctx, const Room &a, const Room &b);
  void CarveHorizontal(GenContext &ctx, int x1, int x2, int y);
  void CarveVertical(GenContext &ctx, int y1, int y2, int x);
  void InferWalls(GenContext &ctx);
  void AssignHeights(GenContext &ctx);
  void PlacePillars(GenContext &ctx);
};

#endif
