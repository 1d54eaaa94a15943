#include <cstdlib>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "test_support.hpp"

namespace {

using test_support::Assert;

const char* const kVariables[] = {
    "WEATHER_MCP_HOST",          "WEATHER_MCP_PORT",
    "WEATHER_MCP_PROVIDER_URL",  "WEATHER_MCP_LATITUDE",
    "WEATHER_MCP_LONGITUDE",     "WEATHER_MCP_TIMEZONE",
    "WEATHER_MCP_PROVIDER_TIMEOUT", "WEATHER_MCP_SESSION_IDLE_TIMEOUT",
    "WEATHER_MCP_MAX_SESSIONS",  "WEATHER_MCP_LOG_LEVEL",
};

void ClearEnvironment() {
  for (const char* name : kVariables) {
    unsetenv(name);
  }
}

void TestDefaults() {
  ClearEnvironment();
  const auto config = core::LoadServerConfig();
  Assert(config.host == "0.0.0.0" && config.port == 8000, "default bind address");
  Assert(config.provider_url == "https://api.open-meteo.com", "default provider");
  Assert(config.location.latitude == 51.836316614873176, "default latitude");
  Assert(config.location.longitude == 5.79300494667676, "default longitude");
  Assert(config.timezone == "Europe/Amsterdam", "default timezone");
  Assert(config.provider_timeout_seconds == 5, "default timeout");
  Assert(config.max_sessions == 256, "default session limit");
}

void TestOverrides() {
  ClearEnvironment();
  setenv("WEATHER_MCP_HOST", "127.0.0.1", 1);
  setenv("WEATHER_MCP_PORT", "9100", 1);
  setenv("WEATHER_MCP_PROVIDER_URL", "http://127.0.0.1:9200/api", 1);
  setenv("WEATHER_MCP_LATITUDE", "52.37", 1);
  setenv("WEATHER_MCP_LONGITUDE", "4.89", 1);
  setenv("WEATHER_MCP_TIMEZONE", "UTC", 1);
  setenv("WEATHER_MCP_PROVIDER_TIMEOUT", "3", 1);
  setenv("WEATHER_MCP_MAX_SESSIONS", "4", 1);

  const auto config = core::LoadServerConfig();
  Assert(config.host == "127.0.0.1" && config.port == 9100, "bind address override");
  Assert(config.provider_url == "http://127.0.0.1:9200/api", "provider override");
  Assert(config.location.latitude == 52.37 && config.location.longitude == 4.89,
         "location override");
  Assert(config.timezone == "UTC", "timezone override");
  Assert(config.provider_timeout_seconds == 3, "timeout override");
  Assert(config.max_sessions == 4, "session limit override");
}

void TestInvalidValuesKeepDefaults() {
  ClearEnvironment();
  setenv("WEATHER_MCP_PORT", "70000", 1);
  setenv("WEATHER_MCP_PROVIDER_URL", "ftp://example.org", 1);
  setenv("WEATHER_MCP_LATITUDE", "north", 1);
  setenv("WEATHER_MCP_LONGITUDE", "200", 1);
  setenv("WEATHER_MCP_PROVIDER_TIMEOUT", "5s", 1);
  setenv("WEATHER_MCP_MAX_SESSIONS", "0", 1);

  const auto config = core::LoadServerConfig();
  const core::ServerConfig defaults;
  Assert(config.port == defaults.port, "out-of-range port ignored");
  Assert(config.provider_url == defaults.provider_url, "unsupported scheme ignored");
  Assert(config.location.latitude == defaults.location.latitude, "non-numeric latitude ignored");
  Assert(config.location.longitude == defaults.location.longitude, "out-of-range longitude ignored");
  Assert(config.provider_timeout_seconds == defaults.provider_timeout_seconds,
         "trailing characters rejected");
  Assert(config.max_sessions == defaults.max_sessions, "zero session limit ignored");
  ClearEnvironment();
}

void TestLogLevels() {
  using core::logging::LogLevel;
  Assert(core::logging::ParseLogLevel("DEBUG") == LogLevel::kDebug, "debug level");
  Assert(core::logging::ParseLogLevel("Warning") == LogLevel::kWarn, "warning alias");
  Assert(!core::logging::ParseLogLevel("verbose").has_value(), "unknown level");

  setenv("WEATHER_MCP_LOG_LEVEL", "error", 1);
  core::logging::InitializeFromEnvironment();
  Assert(core::logging::GetLogLevel() == LogLevel::kError, "level from environment");
  setenv("WEATHER_MCP_LOG_LEVEL", "chatty", 1);
  core::logging::InitializeFromEnvironment();
  Assert(core::logging::GetLogLevel() == LogLevel::kError, "unknown level keeps the current one");
  core::logging::SetLogLevel(LogLevel::kInfo);
  Assert(!core::logging::IsDebugEnabled(), "debug disabled at info");
  ClearEnvironment();
}

void TestCoordinateFormatting() {
  Assert(core::FormatCoordinate(5.79300494667676) == "5.79300494667676", "full precision");
  Assert(core::FormatCoordinate(52.0) == "52", "no trailing zeros");
  Assert(core::FormatCoordinate(-3.7038) == "-3.7038", "negative coordinate");
}

}  // namespace

int main() {
  try {
    TestDefaults();
    TestOverrides();
    TestInvalidValuesKeepDefaults();
    TestLogLevels();
    TestCoordinateFormatting();
  } catch (const std::exception& ex) {
    std::cerr << "config_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
