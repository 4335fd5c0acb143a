#include "NoiseField.h"
#include <algorithm>

NoiseField::NoiseField(int seed, float frequency)
    : seed(seed), frequency(frequency) {
  auto simplex = FastNoise::New<FastNoise::Simplex>();
  auto fractal = FastNoise::New<FastNoise::FractalFBm>();
  fractal->SetSource(simplex);
  fractal->SetOctaveCount(2);
  fractal->SetGain(0.5f);
  fractal->SetLacunarity(2.0f);
  heightNode = fractal;
}

float NoiseField::Sample2D(float x, float y, float freqMul) const {
  float f = frequency * freqMul;
  float v = heightNode->GenSingle2D(x * f, y * f, seed);
  return std::clamp(v, -1.0f, 1.0f);
}

float NoiseField::Sample3D(float x, float y, float z, float freqMul) const {
  float f = frequency * freqMul;
  float v = heightNode->GenSingle3D(x * f, y * f, z * f, seed);
  return std::clamp(v, -1.0f, 1.0f);
}
