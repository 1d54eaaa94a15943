#pragma once

#include "core/config.hpp"

namespace platform {
class HttpServer;
}  // namespace platform

namespace core {

namespace mcp {
class SessionRegistry;
}  // namespace mcp

inline constexpr const char* kMcpPath = "/mcp";
inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

// Registers /, /health and the /mcp JSON-RPC endpoint on `server`.
void ConfigureServer(platform::HttpServer& server, mcp::SessionRegistry& sessions,
                     const ServerConfig& config);

}  // namespace core
