#include "debug/Logger.h"
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  // Console only, and quiet unless something goes wrong
  Logger::Init("");
  Logger::SetLevel(spdlog::level::warn);

  return RUN_ALL_TESTS();
}
