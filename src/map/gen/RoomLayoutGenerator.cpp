#include "RoomLayoutGenerator.h"
#include "../../debug/Logger.h"
#include "../../debug/Profiler.h"
#include "NoiseField.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr int kAttemptsPerRoom = 10;
constexpr double kLoopRatio = 0.3;
constexpr double kPillarWallBoost = 1.3;

double WallHeight(const GenContext &ctx, int x, int y) {
  return 0.8 + ctx.noise.Sample2D((float)x, (float)y) * 0.2;
}

double FloorHeight(const GenContext &ctx, int x, int y) {
  double h = 0.4 + ctx.noise.Sample2D((float)x, (float)y, 0.5f) * 0.1;
  return std::max(kWalkableHeight, h);
}
} // namespace

void RoomLayoutGenerator::Generate(GenContext &ctx) {
  PROFILE_SCOPE("Dungeon");

  ctx.model.placementGrid.Fill(CellKind::Wall);

  PlaceRooms(ctx);
  ConnectRooms(ctx);
  InferWalls(ctx);
  AssignHeights(ctx);
  PlacePillars(ctx);

  LOG_GEN_DEBUG("Dungeon {}x{}: {} rooms (requested {})", ctx.Width(),
                ctx.Height(), ctx.model.rooms.size(), ctx.options.roomCount);
}

void RoomLayoutGenerator::PlaceRooms(GenContext &ctx) {
  PROFILE_SCOPE("Dungeon::Rooms");
  const MapOptions &opt = ctx.options;
  std::vector<Room> &rooms = ctx.model.rooms;

  const int maxAttempts = opt.roomCount * kAttemptsPerRoom;
  for (int attempt = 0;
       attempt < maxAttempts && (int)rooms.size() < opt.roomCount;
       ++attempt) {
    int w = ctx.rng.NextInt(opt.roomMinSize, opt.roomMaxSize);
    int h = ctx.rng.NextInt(opt.roomMinSize, opt.roomMaxSize);

    // Needs a one cell margin on every side
    int spanX = ctx.Width() - w - 2;
    int spanY = ctx.Height() - h - 2;
    if (spanX <= 0 || spanY <= 0)
      continue;

    Room room;
    room.x = 1 + (int)ctx.rng.NextIndex((size_t)spanX);
    room.y = 1 + (int)ctx.rng.NextIndex((size_t)spanY);
    room.width = w;
    room.height = h;
    room.centerX = room.x + w / 2;
    room.centerY = room.y + h / 2;
    room.doorX = room.centerX;
    room.doorY = room.centerY;

    bool overlaps = std::any_of(rooms.begin(), rooms.end(),
                                [&](const Room &other) {
                                  return room.Overlaps(other, 1);
                                });
    if (overlaps)
      continue;

    for (int y = room.y; y < room.y + room.height; ++y) {
      for (int x = room.x; x < room.x + room.width; ++x)
        ctx.SetKind(x, y, CellKind::Floor);
    }
    ctx.Reserve(room.doorX, room.doorY);
    rooms.push_back(room);
  }

  if ((int)rooms.size() < opt.roomCount) {
    LOG_GEN_DEBUG("Dungeon: placed {} of {} rooms after {} attempts",
                  rooms.size(), opt.roomCount, maxAttempts);
  }
}

void RoomLayoutGenerator::ConnectRooms(GenContext &ctx) {
  PROFILE_SCOPE("Dungeon::Corridors");
  const std::vector<Room> &rooms = ctx.model.rooms;
  if (rooms.size() <= 1)
    return;

  for (size_t i = 0; i + 1 < rooms.size(); ++i)
    CarveLCorridor(ctx, rooms[i], rooms[i + 1]);

  // Loops so the layout is not a simple chain
  int extra = (int)std::floor(rooms.size() * kLoopRatio);
  for (int i = 0; i < extra; ++i) {
    size_t a = ctx.rng.NextIndex(rooms.size());
    size_t b = ctx.rng.NextIndex(rooms.size());
    if (a == b)
      continue;
    CarveLCorridor(ctx, rooms[a], rooms[b]);
  }
}

void RoomLayoutGenerator::CarveLCorridor(GenContext &ctx, const Room &a,
                                         const Room &b) {
  if (ctx.rng.Next() > 0.5) {
    CarveHorizontal(ctx, a.centerX, b.centerX, a.centerY);
    CarveVertical(ctx, a.centerY, b.centerY, b.centerX);
  } else {
    CarveVertical(ctx, a.centerY, b.centerY, a.centerX);
    CarveHorizontal(ctx, a.centerX, b.centerX, b.centerY);
  }
}

void RoomLayoutGenerator::CarveHorizontal(GenContext &ctx, int x1, int x2,
                                          int y) {
  for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) {
    if (!ctx.model.InBounds(x, y))
      continue;
    ctx.SetKind(x, y, CellKind::Floor);
    for (int dy : {-1, 1}) {
      if (ctx.model.InBounds(x, y + dy) &&
          ctx.GetKind(x, y + dy) != CellKind::Floor)
        ctx.SetKind(x, y + dy, CellKind::Wall);
    }
  }
}

void RoomLayoutGenerator::CarveVertical(GenContext &ctx, int y1, int y2,
                                        int x) {
  for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) {
    if (!ctx.model.InBounds(x, y))
      continue;
    ctx.SetKind(x, y, CellKind::Floor);
    for (int dx : {-1, 1}) {
      if (ctx.model.InBounds(x + dx, y) &&
          ctx.GetKind(x + dx, y) != CellKind::Floor)
        ctx.SetKind(x + dx, y, CellKind::Wall);
    }
  }
}

void RoomLayoutGenerator::InferWalls(GenContext &ctx) {
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (ctx.GetKind(x, y) == CellKind::Floor)
        continue;

      bool touchesFloor = false;
      for (int dy = -1; dy <= 1 && !touchesFloor; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          if ((dx || dy) && ctx.model.InBounds(x + dx, y + dy) &&
              ctx.GetKind(x + dx, y + dy) == CellKind::Floor) {
            touchesFloor = true;
            break;
          }
        }
      }
      if (touchesFloor)
        ctx.SetKind(x, y, CellKind::Wall);
    }
  }
}

void RoomLayoutGenerator::AssignHeights(GenContext &ctx) {
  PROFILE_SCOPE("Dungeon::Heights");
  for (int y = 0; y < ctx.Height(); ++y) {
    for (int x = 0; x < ctx.Width(); ++x) {
      if (ctx.GetKind(x, y) == CellKind::Floor)
        ctx.SetHeight(x, y, FloorHeight(ctx, x, y));
      else
        ctx.SetHeight(x, y, WallHeight(ctx, x, y));
    }
  }
}

void RoomLayoutGenerator::PlacePillars(GenContext &ctx) {
  PROFILE_SCOPE("Dungeon::Pillars");
  const double chance = ctx.options.wallDensity * kPillarWallBoost * 0.5;
  int placed = 0;

  for (int y = 1; y < ctx.Height() - 1; ++y) {
    for (int x = 1; x < ctx.Width() - 1; ++x) {
      if (ctx.GetKind(x, y) != CellKind::Floor)
        continue;
      if (ctx.GetKind(x, y - 1) != CellKind::Floor ||
          ctx.GetKind(x - 1, y) != CellKind::Floor ||
          ctx.GetKind(x + 1, y) != CellKind::Floor ||
          ctx.GetKind(x, y + 1) != CellKind::Floor)
        continue;

      if (!ctx.rng.Chance(chance) || !ctx.CanBlock(x, y))
        continue;
      ctx.SetCell(x, y, CellKind::Wall, WallHeight(ctx, x, y));
      placed++;
    }
  }
  LOG_GEN_TRACE("Dungeon: {} pillars", placed);
}
