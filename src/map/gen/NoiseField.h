#pragma once

#include <FastNoise/FastNoise.h>

// Seeded coherent noise for height synthesis.
// Simplex source behind a 2 octave FBm, sampled one point at a time.
class NoiseField {
public:
  NoiseField(int seed, float frequency);
  ~NoiseField() = default;

  // SmartNode references must not be shared between fields
  NoiseField(const NoiseField &) = delete;
  NoiseField &operator=(const NoiseField &) = delete;
  NoiseField(NoiseField &&) = delete;
  NoiseField &operator=(NoiseField &&) = delete;

  // [-1, 1]. freqMul scales the base frequency for detail or smoothing layers.
  float Sample2D(float x, float y, float freqMul = 1.0f) const;
  float Sample3D(float x, float y, float z, float freqMul = 1.0f) const;

  int GetSeed() const { return seed; }
  float GetFrequency() const { return frequency; }

private:
  int seed;
  float frequency;

  FastNoise::SmartNode<> heightNode;
};
