#include "core/config.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"

namespace core {
namespace {

using core::logging::LogWarn;

bool ParseInt(const char* key, const std::string& raw, int min, int max, int& out) {
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != raw.size()) {
      LogWarn(std::string{key} + " has trailing characters, keeping default");
      return false;
    }
    if (parsed < min || parsed > max) {
      LogWarn(std::string{key} + " is outside [" + std::to_string(min) + ", " +
              std::to_string(max) + "], keeping default");
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::exception& ex) {
    LogWarn(std::string{"Failed to parse "} + key + ": " + ex.what());
    return false;
  }
}

bool ParseCoordinate(const char* key, const std::string& raw, double limit, double& out) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(raw, &consumed);
    if (consumed != raw.size() || parsed < -limit || parsed > limit) {
      LogWarn(std::string{key} + " is not a coordinate in [-" + FormatCoordinate(limit) + ", " +
              FormatCoordinate(limit) + "], keeping default");
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::exception& ex) {
    LogWarn(std::string{"Failed to parse "} + key + ": " + ex.what());
    return false;
  }
}

}  // namespace

std::string FormatCoordinate(double value) {
  std::ostringstream stream;
  stream << std::setprecision(15) << value;
  return stream.str();
}

ServerConfig LoadServerConfig() {
  ServerConfig config;
  if (const char* host = std::getenv("WEATHER_MCP_HOST")) {
    config.host = host;
  }
  if (const char* port = std::getenv("WEATHER_MCP_PORT")) {
    ParseInt("WEATHER_MCP_PORT", port, 1, 65535, config.port);
  }
  if (const char* url = std::getenv("WEATHER_MCP_PROVIDER_URL")) {
    const std::string value = url;
    if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
      config.provider_url = value;
    } else {
      LogWarn("WEATHER_MCP_PROVIDER_URL must start with http:// or https://, keeping default");
    }
  }
  if (const char* latitude = std::getenv("WEATHER_MCP_LATITUDE")) {
    ParseCoordinate("WEATHER_MCP_LATITUDE", latitude, 90.0, config.location.latitude);
  }
  if (const char* longitude = std::getenv("WEATHER_MCP_LONGITUDE")) {
    ParseCoordinate("WEATHER_MCP_LONGITUDE", longitude, 180.0, config.location.longitude);
  }
  if (const char* timezone = std::getenv("WEATHER_MCP_TIMEZONE")) {
    if (*timezone != '\0') {
      config.timezone = timezone;
    }
  }
  if (const char* timeout = std::getenv("WEATHER_MCP_PROVIDER_TIMEOUT")) {
    ParseInt("WEATHER_MCP_PROVIDER_TIMEOUT", timeout, 1, 30, config.provider_timeout_seconds);
  }
  if (const char* idle = std::getenv("WEATHER_MCP_SESSION_IDLE_TIMEOUT")) {
    ParseInt("WEATHER_MCP_SESSION_IDLE_TIMEOUT", idle, 1, 86400,
             config.session_idle_timeout_seconds);
  }
  if (const char* max_sessions = std::getenv("WEATHER_MCP_MAX_SESSIONS")) {
    int parsed = 0;
    if (ParseInt("WEATHER_MCP_MAX_SESSIONS", max_sessions, 1, 100000, parsed)) {
      config.max_sessions = static_cast<std::size_t>(parsed);
    }
  }
  return config;
}

}  // namespace core
