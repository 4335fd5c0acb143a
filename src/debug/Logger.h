#pragma once

#include <memory>
#include <string>

// This ignores all warnings raised inside External headers
#pragma warning(push, 0)
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#pragma warning(pop)

class Logger {
public:
  // An empty logFile keeps output on the console only
  static void Init(const std::string &logFile = "logs/Cartograph.log");

  inline static std::shared_ptr<spdlog::logger> &GetMainLogger() {
    if (!s_MainLogger)
      Init("");
    return s_MainLogger;
  }
  inline static std::shared_ptr<spdlog::logger> &GetGenLogger() {
    if (!s_GenLogger)
      Init("");
    return s_GenLogger;
  }
  inline static std::shared_ptr<spdlog::logger> &GetNavLogger() {
    if (!s_NavLogger)
      Init("");
    return s_NavLogger;
  }

  static void SetLevel(spdlog::level::level_enum level);

private:
  static std::shared_ptr<spdlog::logger> s_MainLogger;
  static std::shared_ptr<spdlog::logger> s_GenLogger;
  static std::shared_ptr<spdlog::logger> s_NavLogger;
};

// Main Logger Macros
#define LOG_TRACE(...) ::Logger::GetMainLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Logger::GetMainLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Logger::GetMainLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Logger::GetMainLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Logger::GetMainLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Logger::GetMainLogger()->critical(__VA_ARGS__)

// Map Generation Logger Macros
#define LOG_GEN_TRACE(...) ::Logger::GetGenLogger()->trace(__VA_ARGS__)
#define LOG_GEN_DEBUG(...) ::Logger::GetGenLogger()->debug(__VA_ARGS__)
#define LOG_GEN_INFO(...) ::Logger::GetGenLogger()->info(__VA_ARGS__)
#define LOG_GEN_WARN(...) ::Logger::GetGenLogger()->warn(__VA_ARGS__)
#define LOG_GEN_ERROR(...) ::Logger::GetGenLogger()->error(__VA_ARGS__)

// Navigation Logger Macros
#define LOG_NAV_TRACE(...) ::Logger::GetNavLogger()->trace(__VA_ARGS__)
#define LOG_NAV_DEBUG(...) ::Logger::GetNavLogger()->debug(__VA_ARGS__)
#define LOG_NAV_INFO(...) ::Logger::GetNavLogger()->info(__VA_ARGS__)
#define LOG_NAV_WARN(...) ::Logger::GetNavLogger()->warn(__VA_ARGS__)
#define LOG_NAV_ERROR(...) ::Logger::GetNavLogger()->error(__VA_ARGS__)
