#include "TownGenerator.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "../../utils/MathUtils.h"
#include "NoiseField.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr double kTownRadiusRatio = 0.4;
constexpr double kPerimeterRatio = 0.45;
constexpr double kPlazaRatio = 0.15;
constexpr int kPlacementAttempts = 10;
constexpr int kShopCount = 3;
constexpr double kFurnitureChance = 0.05;
constexpr int kGateHalfWidth = 2;

constexpr double kBuildingWallHeight = 0.7;
constexpr double kInteriorHeight = 0.5;
constexpr double kPerimeterHeight = 0.8;
constexpr double kRoadHeight = 0.4;

int PlazaRadius(int width, int height) {
  return (int)std::floor(std::min(width, height) * kPlazaRatio);
}

double PerimeterRadius(int width, int height) {
  return std::min(width, height) * kPerimeterRatio;
}

// Distance from (px, py) to the nearest cell of the rectangle
double DistanceToRect(int px, int py, int x0, int y0, int x1, int y1) {
  int nx = std::max(x0, std::min(px, x1));
  int ny = std::max(y0, std::min(py, y1));
  return MathUtils::Distance(px, py, nx, ny);
}
} // namespace

double TownGenerator::GetTownRadius(int width, int height) {
  return std::min(width, height) * kTownRadiusRatio;
}

void TownGenerator::Generate(GenContext &ctx) {
  PROFILE_SCOPE("Town");

  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      double h = 0.4 + ctx.noise.Sample2D((float)x, (float)y, 0.5f) * 0.05;
      ctx.SetCell(x, y, CellKind::Floor, h);
    }
  }

  glm::ivec2 center(ctx.Width() / 2, ctx.Height() / 2);
  int plazaRadius = PlazaRadius(ctx.Width(), ctx.Height());

  PlaceBuildings(ctx, center);
  CarvePlaza(ctx, center, plazaRadius);
  CarveRoads(ctx, center);
  BuildPerimeterWall(ctx, center);
  AddDecorations(ctx, center, plazaRadius);

  LOG_GEN_DEBUG("Town {}x{}: {} buildings", ctx.Width(), ctx.Height(),
                ctx.model.rooms.size());
}

void TownGenerator::PlaceBuildings(GenContext &ctx, glm::ivec2 center) {
  PROFILE_SCOPE("Town::Buildings");
  int target = ctx.rng.NextInt(5, 14);

  for (int i = 0; i < target; ++i) {
    bool isShop = (int)ctx.model.rooms.size() < kShopCount;
    for (int attempt = 0; attempt < kPlacementAttempts; ++attempt) {
      if (TryPlaceBuilding(ctx, center, isShop))
        break;
    }
  }

  if ((int)ctx.model.rooms.size() < target) {
    LOG_GEN_DEBUG("Town: placed {} of {} buildings", ctx.model.rooms.size(),
                  target);
  }
}

bool TownGenerator::TryPlaceBuilding(GenContext &ctx, glm::ivec2 center,
                                     bool isShop) {
  RandomStream &rng = ctx.rng;
  const int w = ctx.Width();
  const int h = ctx.Height();

  double angle = rng.NextAngle();
  double dist = GetTownRadius(w, h) * rng.NextRange(0.2, 0.9);
  glm::ivec2 bc = MathUtils::PolarOffset(center.x, center.y, angle, dist);
  int bw = rng.NextInt(5, 9);
  int bh = rng.NextInt(5, 9);

  Room room;
  room.width = bw;
  room.height = bh;
  room.x = bc.x - bw / 2;
  room.y = bc.y - bh / 2;
  room.centerX = room.x + bw / 2;
  room.centerY = room.y + bh / 2;
  room.isShop = isShop;

  // Keep a free cell around the building so the door opens onto floor
  if (room.x < 1 || room.y < 1 || room.x + bw > w - 1 || room.y + bh > h - 1)
    return false;

  // The building grown by two cells must stay inside the perimeter ring, so
  // a free band always runs around it
  double perimeter = PerimeterRadius(w, h);
  int x1 = room.x + bw - 1;
  int y1 = room.y + bh - 1;
  const int corners[4][2] = {{room.x - 2, room.y - 2},
                             {x1 + 2, room.y - 2},
                             {room.x - 2, y1 + 2},
                             {x1 + 2, y1 + 2}};
  for (const auto &c : corners) {
    if (MathUtils::Distance(center.x, center.y, c[0], c[1]) >= perimeter - 0.5)
      return false;
  }

  if (DistanceToRect(center.x, center.y, room.x - 1, room.y - 1, x1 + 1,
                     y1 + 1) <= PlazaRadius(w, h))
    return false;

  for (const Room &other : ctx.model.rooms) {
    if (room.Overlaps(other, 1))
      return false;
  }

  BuildBuilding(ctx, room);
  ctx.model.rooms.push_back(room);
  FurnishInterior(ctx, room);
  return true;
}

void TownGenerator::BuildBuilding(GenContext &ctx, Room &room) {
  int x1 = room.x + room.width - 1;
  int y1 = room.y + room.height - 1;

  for (int y = room.y; y <= y1; ++y) {
    for (int x = room.x; x <= x1; ++x) {
      bool outline = x == room.x || x == x1 || y == room.y || y == y1;
      if (outline)
        ctx.SetCell(x, y, CellKind::Wall, kBuildingWallHeight);
      else
        ctx.SetCell(x, y, CellKind::Floor, kInteriorHeight);
    }
  }

  // 0 top, 1 right, 2 bottom, 3 left; (dx, dy) points out of the building
  int side = ctx.rng.NextInt(0, 3);
  int dx = 0;
  int dy = 0;
  switch (side) {
  case 0:
    room.doorX = room.x + room.width / 2;
    room.doorY = room.y;
    dy = -1;
    break;
  case 1:
    room.doorX = x1;
    room.doorY = room.y + room.height / 2;
    dx = 1;
    break;
  case 2:
    room.doorX = room.x + room.width / 2;
    room.doorY = y1;
    dy = 1;
    break;
  default:
    room.doorX = room.x;
    room.doorY = room.y + room.height / 2;
    dx = -1;
    break;
  }

  ctx.SetCell(room.doorX, room.doorY, CellKind::Floor, kInteriorHeight);
  ctx.Reserve(room.doorX, room.doorY);
  ctx.Reserve(room.doorX + dx, room.doorY + dy);
  ctx.Reserve(room.doorX - dx, room.doorY - dy);
  ctx.Reserve(room.centerX, room.centerY);
}

void TownGenerator::FurnishInterior(GenContext &ctx, const Room &room) {
  for (int y = room.y + 1; y < room.y + room.height - 1; ++y) {
    for (int x = room.x + 1; x < room.x + room.width - 1; ++x) {
      if (ctx.IsReserved(x, y) || !ctx.rng.Chance(kFurnitureChance))
        continue;
      if (ctx.CanBlock(x, y))
        ctx.SetCell(x, y, CellKind::Obstacle, 0.6);
    }
  }
}

void TownGenerator::CarvePlaza(GenContext &ctx, glm::ivec2 center,
                               int plazaRadius) {
  for (int y = center.y - plazaRadius; y <= center.y + plazaRadius; ++y) {
    for (int x = center.x - plazaRadius; x <= center.x + plazaRadius; ++x) {
      if (ctx.model.InBounds(x, y) &&
          MathUtils::Distance(center.x, center.y, x, y) <= plazaRadius)
        ctx.SetCell(x, y, CellKind::Floor, 0.4);
    }
  }
}

void TownGenerator::CarveRoads(GenContext &ctx, glm::ivec2 center) {
  PROFILE_SCOPE("Town::Roads");
  const std::vector<Room> &rooms = ctx.model.rooms;

  for (const Room &room : rooms)
    CarveRoad(ctx, room.doorX, room.doorY, center.x, center.y);

  int extra = (int)std::floor(rooms.size() * 0.5);
  for (int i = 0; i < extra; ++i) {
    size_t a = ctx.rng.NextIndex(rooms.size());
    size_t b = ctx.rng.NextIndex(rooms.size());
    if (a == b)
      continue;
    CarveRoad(ctx, rooms[a].doorX, rooms[a].doorY, rooms[b].doorX,
              rooms[b].doorY);
  }
}

void TownGenerator::CarveRoad(GenContext &ctx, int x0, int y0, int x1,
                              int y1) {
  int width = ctx.rng.NextInt(1, 2);

  for (const glm::ivec2 &p : MathUtils::LinePoints(x0, y0, x1, y1)) {
    for (int dy = -width; dy <= width; ++dy) {
      for (int dx = -width; dx <= width; ++dx) {
        int nx = p.x + dx;
        int ny = p.y + dy;
        if (!ctx.model.InBounds(nx, ny) ||
            ctx.GetKind(nx, ny) == CellKind::Wall)
          continue;
        double d = std::sqrt((double)(dx * dx + dy * dy));
        if (d > width)
          continue;
        ctx.SetCell(nx, ny, CellKind::Floor, kRoadHeight - (d / width) * 0.05);
      }
    }
  }
}

void TownGenerator::BuildPerimeterWall(GenContext &ctx, glm::ivec2 center) {
  double radius = PerimeterRadius(ctx.Width(), ctx.Height());

  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      double d = MathUtils::Distance(center.x, center.y, x, y);
      if (std::abs(d - radius) > 0.5)
        continue;

      bool gate = std::abs(x - center.x) <= kGateHalfWidth ||
                  std::abs(y - center.y) <= kGateHalfWidth;
      if (gate) {
        ctx.SetCell(x, y, CellKind::Floor, kRoadHeight);
        ctx.Reserve(x, y);
      } else {
        ctx.SetCell(x, y, CellKind::Wall, kPerimeterHeight);
      }
    }
  }
}

void TownGenerator::AddDecorations(GenContext &ctx, glm::ivec2 center,
                                   int plazaRadius) {
  // Fountain keeps a ring of plaza around it
  int fountain = std::min(3, std::max(1, plazaRadius - 1));
  for (int y = center.y - fountain; y <= center.y + fountain; ++y) {
    for (int x = center.x - fountain; x <= center.x + fountain; ++x) {
      if (!ctx.model.InBounds(x, y) || ctx.IsReserved(x, y))
        continue;
      double d = MathUtils::Distance(center.x, center.y, x, y);
      if (d <= fountain)
        ctx.SetCell(x, y, CellKind::Obstacle,
                    0.5 + (1.0 - d / fountain) * 0.3);
    }
  }

  RandomStream &rng = ctx.rng;
  double townRadius = GetTownRadius(ctx.Width(), ctx.Height());
  int count = rng.NextInt(10, 25);
  int placed = 0;
  for (int i = 0; i < count; ++i) {
    double angle = rng.NextAngle();
    double dist = townRadius * rng.NextRange(0.1, 0.9);
    glm::ivec2 p = MathUtils::PolarOffset(center.x, center.y, angle, dist);

    if (!ctx.model.InBounds(p.x, p.y) ||
        ctx.GetKind(p.x, p.y) != CellKind::Floor ||
        InsideAnyBuilding(ctx, p.x, p.y) || !ctx.CanBlock(p.x, p.y))
      continue;
    ctx.SetCell(p.x, p.y, CellKind::Obstacle, 0.6);
    placed++;
  }
  LOG_GEN_TRACE("Town: {} of {} decorations placed", placed, count);
}

bool TownGenerator::InsideAnyBuilding(const GenContext &ctx, int x,
                                      int y) const {
  for (const Room &room : ctx.model.rooms) {
    if (room.Contains(x, y))
      return true;
  }
  return false;
}
