#include "MapModel.h"

size_t MapModel::CountCells(CellKind kind) const {
  size_t count = 0;
  for (CellKind k : placementGrid.Data()) {
    if (k == kind)
      count++;
  }
  return count;
}

size_t MapModel::CountWalkable() const {
  size_t count = 0;
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      if (IsWalkable(x, y))
        count++;
    }
  }
  return count;
}

static char GlyphFor(CellKind kind, double h) {
  switch (kind) {
  case CellKind::Floor:
    return h >= kWalkableHeight ? '.' : ',';
  case CellKind::Water:
    return '~';
  case CellKind::Chest:
    return '$';
  case CellKind::Obstacle:
    return 'o';
  case CellKind::Wall:
    return '#';
  }
  return '?';
}

std::string MapModel::ToAscii(bool withEntities) const {
  Grid<char> glyphs(width, height, ' ');
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      glyphs(x, y) = GlyphFor(placementGrid(x, y), heightMap(x, y));
    }
  }

  if (withEntities) {
    for (const auto &npc : npcSpawns)
      glyphs.Set(npc.x, npc.y, npc.isShop ? 'S' : 'N');
    for (const auto &enemy : enemySpawns) {
      char c = 'e';
      if (enemy.tier == EnemyTier::Elite)
        c = 'E';
      else if (enemy.tier == EnemyTier::Boss)
        c = 'B';
      glyphs.Set(enemy.x, enemy.y, c);
    }
  }

  std::string out;
  out.reserve(static_cast<size_t>(width + 1) * height);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x)
      out.push_back(glyphs(x, y));
    out.push_back('\n');
  }
  return out;
}

void to_json(json &j, const Room &r) {
  j = json{{"x", r.x},           {"y", r.y},
           {"width", r.width},   {"height", r.height},
           {"centerX", r.centerX}, {"centerY", r.centerY},
           {"doorX", r.doorX},   {"doorY", r.doorY},
           {"isShop", r.isShop}};
}

void to_json(json &j, const EnemySpawn &e) {
  j = json{{"x", e.x},
           {"y", e.y},
           {"kind", e.kind},
           {"tier", e.tier},
           {"level", e.level}};
  if (e.groupId)
    j["groupId"] = *e.groupId;
}

void to_json(json &j, const ShopItem &item) {
  j = json{{"id", item.id}, {"price", item.price}};
}

void to_json(json &j, const NpcSpawn &n) {
  j = json{{"x", n.x},
           {"y", n.y},
           {"kind", n.kind},
           {"isShop", n.isShop},
           {"dialogueLines", n.dialogueLines}};
  if (n.shopKind)
    j["shopKind"] = *n.shopKind;
  if (n.shopItems)
    j["shopItems"] = *n.shopItems;
}

void to_json(json &j, const MapModel &m) {
  // Rows of the grids are y, columns x, matching the model's indexing
  json heights = json::array();
  json cells = json::array();
  for (int y = 0; y < m.height; ++y) {
    json heightRow = json::array();
    json cellRow = json::array();
    for (int x = 0; x < m.width; ++x) {
      heightRow.push_back(m.heightMap(x, y));
      cellRow.push_back(static_cast<int>(m.placementGrid(x, y)));
    }
    heights.push_back(std::move(heightRow));
    cells.push_back(std::move(cellRow));
  }

  j = json{{"width", m.width},
           {"height", m.height},
           {"tileSize", m.tileSize},
           {"seed", m.seed},
           {"mapType", m.mapType},
           {"difficulty", m.difficulty},
           {"heightMap", std::move(heights)},
           {"placementGrid", std::move(cells)},
           {"rooms", m.rooms},
           {"enemySpawns", m.enemySpawns},
           {"npcSpawns", m.npcSpawns}};
}
