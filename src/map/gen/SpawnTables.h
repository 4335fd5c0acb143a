#pragma once

#include "../MapOptions.h"
#include <string>
#include <vector>

// Fixed pools and per-map-type multipliers used by the placement passes.

struct PlacementMultipliers {
  double chest;
  double obstacle;
  double enemy;
  // Obstacle cells take a height drawn from [min, max)
  double obstacleHeightMin;
  double obstacleHeightMax;
};

PlacementMultipliers GetPlacementMultipliers(MapType type);

// Chance that an ordinary spawn is promoted to an elite
double GetEliteChance(Difficulty difficulty);

const std::vector<std::string> &GetEnemyPool(MapType type);

const std::vector<std::string> &GetShopkeeperKinds();
const std::vector<std::string> &GetShopKinds();
const std::vector<std::string> &GetTownsfolkKinds();

const std::vector<std::string> &GetShopGreetings();
const std::vector<std::string> &GetTownsfolkLines();
