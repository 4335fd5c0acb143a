#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ProfileResult {
  std::string Name;
  long long Start;
  long long End;
};

class Profiler {
public:
  Profiler(const Profiler &) = delete;
  Profiler(Profiler &&) = delete;

  void WriteProfile(const ProfileResult &result);

  static Profiler &Get() {
    static Profiler instance;
    return instance;
  }

  void SetEnabled(bool enabled) { m_Enabled = enabled; }
  bool IsEnabled() const { return m_Enabled; }

  // Name -> History (ms), copied under the lock
  std::unordered_map<std::string, std::vector<float>> GetResults();
  void ClearResults();

private:
  Profiler() = default;
  ~Profiler() = default;

  std::atomic<bool> m_Enabled{true};
  std::mutex m_Lock;
  std::unordered_map<std::string, std::vector<float>> m_Results;
};

class ProfileTimer {
public:
  ProfileTimer(const char *name);
  ~ProfileTimer();

  void Stop();

private:
  const char *m_Name;
  std::chrono::time_point<std::chrono::high_resolution_clock> m_StartTimepoint;
  bool m_Stopped;
  bool m_Active;
};

#if 1 // Enable Profiling
#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ProfileTimer PROFILE_CONCAT(timer, __LINE__)(name)
#else
#define PROFILE_SCOPE(name)
#endif
