#ifndef BENCHMARK_H
#define BENCHMARK_H

#include "../map/MapOptions.h"
#include <map>
#include <string>

#include <atomic>
#include <mutex>

struct BenchmarkResult {
  float totalTimeMs;
  float avgMapTimeMs;
  int mapsGenerated;
  std::map<std::string, float> stepAvgTimes;
};

struct BenchmarkStatus {
  std::atomic<bool> isRunning{false};
  std::atomic<float> progress{0.0f}; // 0.0 to 1.0
  std::atomic<bool> isFinished{false};
  BenchmarkResult result;
  std::mutex resultMutex;
};

// Generates `iterations` maps of one type with seeds options.seed,
// options.seed + 1, ... and returns the timings (blocking)
BenchmarkResult RunMapGenBenchmark(const MapOptions &options, MapType type,
                                   int iterations);

// Starts benchmark in a detached thread
void StartBenchmarkAsync(const MapOptions &options, MapType type,
                         int iterations);
BenchmarkStatus &GetBenchmarkStatus();

#endif // BENCHMARK_H
