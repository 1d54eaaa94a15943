#include <chrono>
#include <exception>
#include <string>

#include "core/app.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/session_registry.hpp"
#include "core/tool_dispatcher.hpp"
#include "core/tool_registry.hpp"
#include "core/weather_provider.hpp"
#include "platform/http_server.hpp"

int main() {
  core::logging::InitializeFromEnvironment();
  const auto config = core::LoadServerConfig();

  try {
    const auto registry = core::mcp::BuildWeatherToolRegistry(config.location);
    const core::weather::OpenMeteoProvider provider(config.provider_url,
                                                    config.provider_timeout_seconds);
    const core::mcp::ToolDispatcher dispatcher(registry, provider,
                                               {config.location, config.timezone});
    core::mcp::SessionRegistry sessions(dispatcher, config.max_sessions,
                                        std::chrono::seconds(config.session_idle_timeout_seconds));

    platform::HttpServer server;
    core::ConfigureServer(server, sessions, config);

    core::logging::LogInfo("Weather provider " + config.provider_url + " (timeout " +
                           std::to_string(config.provider_timeout_seconds) + "s), location " +
                           core::FormatCoordinate(config.location.latitude) + ", " +
                           core::FormatCoordinate(config.location.longitude));
    core::logging::LogInfo("Starting " + std::string{core::kServerName} + " " +
                           core::kServerVersion + " on " + config.host + ":" +
                           std::to_string(config.port));
    server.Start(config.host, config.port);
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    return 1;
  }

  core::logging::LogInfo("Server shut down gracefully.");
  return 0;
}
