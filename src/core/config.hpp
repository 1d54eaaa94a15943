#pragma once

#include <cstddef>
#include <string>

namespace core {

inline constexpr const char* kServerName = "weather-mcp";
inline constexpr const char* kServerVersion = "0.3.0";

struct Location {
  double latitude = 0.0;
  double longitude = 0.0;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  std::string provider_url = "https://api.open-meteo.com";
  Location location{51.836316614873176, 5.79300494667676};
  std::string timezone = "Europe/Amsterdam";
  int provider_timeout_seconds = 5;
  int session_idle_timeout_seconds = 1800;
  std::size_t max_sessions = 256;
};

// Reads the WEATHER_MCP_* environment variables on top of the defaults above.
// Invalid values are logged and ignored.
ServerConfig LoadServerConfig();

std::string FormatCoordinate(double value);

}  // namespace core
