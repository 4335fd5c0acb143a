#include "Logger.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::s_MainLogger;
std::shared_ptr<spdlog::logger> Logger::s_GenLogger;
std::shared_ptr<spdlog::logger> Logger::s_NavLogger;

static std::shared_ptr<spdlog::logger>
CreateLogger(const std::string &name, std::vector<spdlog::sink_ptr> &sinks) {
  // Re-initialising replaces the registered logger of the same name
  spdlog::drop(name);
  auto logger =
      std::make_shared<spdlog::logger>(name, begin(sinks), end(sinks));
  spdlog::register_logger(logger);
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

void Logger::Init(const std::string &logFile) {
  std::vector<spdlog::sink_ptr> logSinks;
  logSinks.emplace_back(
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  logSinks[0]->set_pattern("%^[%T] [%n] :%$ %v");

  if (!logFile.empty()) {
    std::filesystem::path path(logFile);
    std::error_code ec;
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path()))
      std::filesystem::create_directories(path.parent_path(), ec);

    if (!ec) {
      logSinks.emplace_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true));
      logSinks[1]->set_pattern("[%T] [%l] [%n] : %v");
    }
  }

  s_MainLogger = CreateLogger("MAIN", logSinks);
  s_MainLogger->flush_on(spdlog::level::trace);
  s_GenLogger = CreateLogger("MAPGEN", logSinks);
  s_NavLogger = CreateLogger("NAV", logSinks);

  if (logSinks.size() < 2 && !logFile.empty())
    s_MainLogger->warn("Could not create log directory for {}", logFile);
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  GetMainLogger()->set_level(level);
  GetGenLogger()->set_level(level);
  GetNavLogger()->set_level(level);
}
