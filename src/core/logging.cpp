#include "core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace {

using core::logging::LogLevel;

std::atomic<LogLevel> g_log_level{LogLevel::kInfo};
std::mutex g_log_mutex;

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_snapshot;
#if defined(_WIN32)
  gmtime_s(&tm_snapshot, &now_time);
#else
  gmtime_r(&now_time, &tm_snapshot);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_snapshot, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "INFO";
}

}  // namespace

namespace core::logging {

std::optional<LogLevel> ParseLogLevel(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  return std::nullopt;
}

void InitializeFromEnvironment() {
  const char* env = std::getenv("WEATHER_MCP_LOG_LEVEL");
  if (env == nullptr) {
    return;
  }
  if (const auto level = ParseLogLevel(env)) {
    SetLogLevel(*level);
  } else {
    LogWarn(std::string{"Ignoring unknown WEATHER_MCP_LOG_LEVEL '"} + env + "'");
  }
}

void SetLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel GetLogLevel() { return g_log_level.load(); }

bool IsDebugEnabled() { return GetLogLevel() == LogLevel::kDebug; }

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) > static_cast<int>(g_log_level.load())) {
    return;
  }

  const std::string timestamp = CurrentTimestamp();
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << timestamp << " [" << ToString(level) << "] " << message << '\n';
  std::cerr.flush();
}

void LogInfo(const std::string& message) { Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& message) { Log(LogLevel::kWarn, message); }

void LogError(const std::string& message) { Log(LogLevel::kError, message); }

void LogDebug(const std::string& message) { Log(LogLevel::kDebug, message); }

}  // namespace core::logging
