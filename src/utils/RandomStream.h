#pragma once

#include <cstddef>
#include <cstdint>
#include <glm/gtc/constants.hpp>

// Seeded linear congruential generator shared by every stage of a map
// generation run. Identical seeds reproduce identical maps, so nothing in the
// generation pipeline may draw from another source of randomness.
class RandomStream {
public:
  static constexpr uint64_t kModulus = 0x80000000ull; // 2^31
  static constexpr uint64_t kMultiplier = 1103515245ull;
  static constexpr uint64_t kIncrement = 12345ull;

  explicit RandomStream(uint32_t seed = 0)
      : m_Seed(seed), m_State(seed % kModulus) {}

  // [0,1)
  double Next() {
    m_State = (kMultiplier * m_State + kIncrement) % kModulus;
    return static_cast<double>(m_State) / static_cast<double>(kModulus);
  }

  // Uniform integer in [lo, hiInclusive]
  int NextInt(int lo, int hiInclusive) {
    if (hiInclusive <= lo)
      return lo;
    return lo + static_cast<int>(Next() * (hiInclusive - lo + 1));
  }

  // Uniform index in [0, count)
  size_t NextIndex(size_t count) {
    if (count == 0)
      return 0;
    return static_cast<size_t>(Next() * static_cast<double>(count));
  }

  double NextRange(double lo, double hi) { return lo + Next() * (hi - lo); }

  double NextAngle() { return Next() * glm::two_pi<double>(); }

  bool Chance(double p) { return Next() < p; }

  uint32_t GetSeed() const { return m_Seed; }

private:
  uint32_t m_Seed;
  uint64_t m_State;
};
