#include "Benchmark.h"
#include "../map/MapGenerator.h"
#include "Logger.h"
#include "Profiler.h"
#include <chrono>
#include <functional>
#include <thread>

static BenchmarkStatus s_Status;

BenchmarkStatus &GetBenchmarkStatus() { return s_Status; }

// Averages every stage the Profiler recorded during the run
static void CollectStepAverages(BenchmarkResult &result) {
  auto profilerResults = Profiler::Get().GetResults();
  for (const auto &kv : profilerResults) {
    const std::string &name = kv.first;
    const std::vector<float> &history = kv.second;

    float sum = 0.0f;
    for (float v : history)
      sum += v;

    if (!history.empty()) {
      result.stepAvgTimes[name] = sum / history.size();
    }
  }
}

static BenchmarkResult
RunIterations(const MapOptions &options, MapType type, int iterations,
              const std::function<void(float)> &onProgress) {
  BenchmarkResult result = {};

  // Clear previous profiling data
  Profiler::Get().ClearResults();

  MapGenerator generator;
  MapOptions runOptions = options;

  auto start = std::chrono::high_resolution_clock::now();
  int count = 0;
  for (int i = 0; i < iterations; ++i) {
    runOptions.seed = options.seed + (uint32_t)i;
    MapModel model = generator.GenerateMap(type, runOptions);
    (void)model;
    count++;
    if (onProgress)
      onProgress((float)count / iterations);
  }
  auto end = std::chrono::high_resolution_clock::now();
  std::chrono::duration<float, std::milli> duration = end - start;

  result.totalTimeMs = duration.count();
  result.mapsGenerated = count;
  result.avgMapTimeMs = (count > 0) ? (result.totalTimeMs / count) : 0.0f;

  CollectStepAverages(result);
  return result;
}

void StartBenchmarkAsync(const MapOptions &options, MapType type,
                         int iterations) {
  if (s_Status.isRunning)
    return; // Prevent multiple runs

  s_Status.isRunning = true;
  s_Status.isFinished = false;
  s_Status.progress = 0.0f;

  std::thread([options, type, iterations]() {
    BenchmarkResult result = RunIterations(
        options, type, iterations,
        [](float progress) { s_Status.progress = progress; });

    {
      std::lock_guard<std::mutex> lock(s_Status.resultMutex);
      s_Status.result = result;
    }
    LOG_INFO("Benchmark finished: {} {} maps in {:.2f} ms", result.mapsGenerated,
             ToString(type), result.totalTimeMs);
    s_Status.isFinished = true;
    s_Status.isRunning = false;
  }).detach();
}

BenchmarkResult RunMapGenBenchmark(const MapOptions &options, MapType type,
                                   int iterations) {
  return RunIterations(options, type, iterations, nullptr);
}
