#pragma once

#include <optional>
#include <string>

namespace core::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Reads WEATHER_MCP_LOG_LEVEL. All output goes to stderr so that stdout stays
// free for the stdio transport.
void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();

std::optional<LogLevel> ParseLogLevel(std::string value);

void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace core::logging
