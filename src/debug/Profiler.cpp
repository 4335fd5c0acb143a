#include "Profiler.h"

namespace {
constexpr size_t kHistorySize = 100;
} // namespace

void Profiler::WriteProfile(const ProfileResult &result) {
  std::lock_guard<std::mutex> lock(m_Lock);

  // Microseconds to milliseconds
  float duration = (result.End - result.Start) * 0.001f;

  std::vector<float> &history = m_Results[result.Name];
  history.push_back(duration);
  if (history.size() > kHistorySize)
    history.erase(history.begin());
}

std::unordered_map<std::string, std::vector<float>> Profiler::GetResults() {
  std::lock_guard<std::mutex> lock(m_Lock);
  return m_Results;
}

void Profiler::ClearResults() {
  std::lock_guard<std::mutex> lock(m_Lock);
  m_Results.clear();
}

ProfileTimer::ProfileTimer(const char *name)
    : m_Name(name), m_Stopped(false), m_Active(Profiler::Get().IsEnabled()) {
  if (m_Active)
    m_StartTimepoint = std::chrono::high_resolution_clock::now();
}

ProfileTimer::~ProfileTimer() {
  if (!m_Stopped && m_Active)
    Stop();
}

void ProfileTimer::Stop() {
  if (!m_Active)
    return;
  auto endTimepoint = std::chrono::high_resolution_clock::now();

  long long start =
      std::chrono::time_point_cast<std::chrono::microseconds>(m_StartTimepoint)
          .time_since_epoch()
          .count();
  long long end =
      std::chrono::time_point_cast<std::chrono::microseconds>(endTimepoint)
          .time_since_epoch()
          .count();
  Profiler::Get().WriteProfile({m_Name, start, end});

  m_Stopped = true;
}
