#include "SpawnTables.h"

PlacementMultipliers GetPlacementMultipliers(MapType type) {
  switch (type) {
  case MapType::Dungeon:
    return {1.5, 0.7, 1.2, 0.6, 0.8};
  case MapType::Field:
    return {1.0, 1.3, 0.8, 0.5, 0.8};
  case MapType::Arena:
    // Arena enemies are a fixed boss encounter, not density driven
    return {0.5, 0.5, 0.0, 0.5, 0.6};
  case MapType::Town:
    return {0.1, 0.2, 0.1, 0.5, 0.6};
  }
  return {1.0, 1.0, 1.0, 0.5, 0.6};
}

double GetEliteChance(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Nightmare:
    return 0.15;
  case Difficulty::Hell:
    return 0.25;
  default:
    return 0.05;
  }
}

const std::vector<std::string> &GetEnemyPool(MapType type) {
  static const std::vector<std::string> dungeon = {"skeleton", "zombie",
                                                   "ghost", "spider", "slime"};
  static const std::vector<std::string> field = {"wolf", "bandit", "goblin",
                                                 "troll", "ogre"};
  static const std::vector<std::string> town = {"thief", "drunkard", "rat",
                                                "stray_dog"};
  static const std::vector<std::string> fallback = {"goblin", "orc", "troll",
                                                    "skeleton"};
  switch (type) {
  case MapType::Dungeon:
    return dungeon;
  case MapType::Field:
    return field;
  case MapType::Town:
    return town;
  default:
    return fallback;
  }
}

const std::vector<std::string> &GetShopkeeperKinds() {
  static const std::vector<std::string> kinds = {
      "blacksmith", "merchant", "alchemist", "jeweler", "armorer"};
  return kinds;
}

const std::vector<std::string> &GetShopKinds() {
  static const std::vector<std::string> kinds = {"weapon", "armor", "potion",
                                                 "general", "magic"};
  return kinds;
}

const std::vector<std::string> &GetTownsfolkKinds() {
  static const std::vector<std::string> kinds = {
      "villager", "guard", "child", "elder", "noble", "beggar", "bard"};
  return kinds;
}

const std::vector<std::string> &GetShopGreetings() {
  static const std::vector<std::string> lines = {
      "Welcome! Looking for something?",
      "Only the finest goods here.",
      "How about this one at a special price?"};
  return lines;
}

const std::vector<std::string> &GetTownsfolkLines() {
  static const std::vector<std::string> lines = {
      "Lovely weather today.",
      "This town has always been a peaceful place.",
      "They say strange sounds come from the forest nearby.",
      "An adventurer? Splendid!",
      "Have you come from far away?",
      "Dangerous monsters roam the eastern mountains. Be careful.",
      "Legend says treasure sleeps in the southern cave.",
      "The mayor hasn't been seen in a while. I wonder what happened.",
      "The merchants' guild is on the north side.",
      "Wolf packs have been spotted in the western forest lately."};
  return lines;
}
