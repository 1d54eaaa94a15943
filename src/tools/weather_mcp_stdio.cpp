#include <exception>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/mcp_session.hpp"
#include "core/stdio_transport.hpp"
#include "core/tool_dispatcher.hpp"
#include "core/tool_registry.hpp"
#include "core/weather_provider.hpp"

int main() {
  std::ios::sync_with_stdio(false);
  core::logging::InitializeFromEnvironment();

  try {
    const auto config = core::LoadServerConfig();
    const auto registry = core::mcp::BuildWeatherToolRegistry(config.location);
    const core::weather::OpenMeteoProvider provider(config.provider_url,
                                                    config.provider_timeout_seconds);
    const core::mcp::ToolDispatcher dispatcher(registry, provider,
                                               {config.location, config.timezone});
    core::mcp::Session session(dispatcher);

    core::logging::LogInfo(std::string{core::kServerName} + " " + core::kServerVersion +
                           " serving MCP over stdio");
    const int malformed = core::mcp::RunStdio(std::cin, std::cout, session);
    core::logging::LogInfo("stdin closed, " + std::to_string(malformed) +
                           " malformed message(s) skipped");
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Fatal MCP stdio error: "} + ex.what());
    return 1;
  }
  return 0;
}
