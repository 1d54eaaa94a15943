#include "core/app.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "core/json_rpc.hpp"
#include "core/logging.hpp"
#include "core/session_registry.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_server.hpp"

namespace core {
namespace {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

const auto kServerStart = std::chrono::steady_clock::now();

void ApplyCors(platform::HttpResponse& response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] = "GET,POST,DELETE,OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "Content-Type, Accept, Mcp-Session-Id";
  response.headers["Access-Control-Expose-Headers"] = kSessionHeader;
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump();
  ApplyCors(response);
  return response;
}

platform::HttpResponse EmptyResponse(int status) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type.clear();
  ApplyCors(response);
  return response;
}

platform::HttpResponse RpcErrorResponse(int http_status, int code, const std::string& message) {
  return JsonResponse(mcp::MakeErrorPayload(nullptr, code, message), http_status);
}

std::string InfoText(const mcp::ToolRegistry& registry, const ServerConfig& config) {
  std::ostringstream stream;
  stream << "MCP Weather Server " << kServerVersion << "\n\n"
         << "Available endpoints:\n"
         << "- GET /health - Health check\n"
         << "- POST " << kMcpPath << " - MCP endpoint (JSON-RPC, Streamable HTTP)\n"
         << "- DELETE " << kMcpPath << " - End an MCP session\n\n"
         << "Location: " << FormatCoordinate(config.location.latitude) << ", "
         << FormatCoordinate(config.location.longitude) << " (" << config.timezone << ")\n"
         << "Tools:";
  for (const auto& tool : registry.List()) {
    stream << ' ' << tool.name;
  }
  stream << '\n';
  return stream.str();
}

std::string MethodOf(const json& message) {
  if (message.is_object()) {
    const auto it = message.find("method");
    if (it != message.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

bool IsErrorPayload(const std::optional<json>& payload) {
  return payload.has_value() && payload->contains("error");
}

platform::HttpResponse ToHttpResponse(const std::optional<json>& payload) {
  if (!payload) {
    return EmptyResponse(202);
  }
  return JsonResponse(*payload);
}

}  // namespace

void ConfigureServer(platform::HttpServer& server, mcp::SessionRegistry& sessions,
                     const ServerConfig& config) {
  auto handle_root = [&sessions, config](const platform::HttpRequest&) {
    platform::HttpResponse response;
    response.content_type = "text/plain; charset=utf-8";
    response.body = InfoText(sessions.Dispatcher().Registry(), config);
    return response;
  };

  auto handle_health = [&sessions](const platform::HttpRequest&) {
    const auto uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - kServerStart)
                               .count();
    return JsonResponse(json{{"status", "ok"},
                             {"version", kServerVersion},
                             {"uptime_ms", uptime_ms},
                             {"sessions", sessions.Size()}});
  };

  auto handle_post = [&sessions](const platform::HttpRequest& request) {
    const auto message = json::parse(request.body, nullptr, false);
    if (message.is_discarded()) {
      LogWarn("POST " + std::string{kMcpPath} + " from " + request.remote_addr +
              ": unparseable body");
      return RpcErrorResponse(400, mcp::kParseError, "Parse error");
    }

    const std::string method = MethodOf(message);
    const std::string session_id = platform::HeaderValue(request, kSessionHeader);
    LogDebug("POST " + std::string{kMcpPath} + " method=" + method +
             (session_id.empty() ? "" : " session=" + session_id));

    if (!session_id.empty()) {
      auto session = sessions.Find(session_id);
      if (!session) {
        return RpcErrorResponse(404, mcp::kInvalidRequest, "Unknown or expired session");
      }
      return ToHttpResponse(session->HandleMessage(message));
    }

    if (method != "initialize" || !message.contains("id")) {
      // No session yet: answer from a fresh, uninitialized session so that
      // tools requests receive the sequencing error. An initialize sent as a
      // notification gets no answer and opens nothing.
      mcp::Session transient(sessions.Dispatcher());
      return ToHttpResponse(transient.HandleMessage(message));
    }

    auto opened = sessions.Open();
    if (!opened) {
      return RpcErrorResponse(503, mcp::kInternalError, "Too many open sessions");
    }
    const auto payload = opened->session->HandleMessage(message);
    if (IsErrorPayload(payload)) {
      sessions.Close(opened->id);
      return ToHttpResponse(payload);
    }
    LogInfo("New MCP session " + opened->id + " from " + request.remote_addr);
    auto response = ToHttpResponse(payload);
    response.headers[kSessionHeader] = opened->id;
    return response;
  };

  auto handle_delete = [&sessions](const platform::HttpRequest& request) {
    const std::string session_id = platform::HeaderValue(request, kSessionHeader);
    if (session_id.empty()) {
      return RpcErrorResponse(400, mcp::kInvalidRequest, "Missing Mcp-Session-Id header");
    }
    if (!sessions.Close(session_id)) {
      return RpcErrorResponse(404, mcp::kInvalidRequest, "Unknown or expired session");
    }
    LogInfo("MCP session " + session_id + " closed by client");
    return EmptyResponse(204);
  };

  auto handle_preflight = [](const platform::HttpRequest&) { return EmptyResponse(204); };

  server.AddHandler(platform::HttpMethod::kGet, "/", handle_root);
  server.AddHandler(platform::HttpMethod::kGet, "/health", handle_health);
  server.AddHandler(platform::HttpMethod::kPost, kMcpPath, handle_post);
  server.AddHandler(platform::HttpMethod::kDelete, kMcpPath, handle_delete);
  server.AddHandler(platform::HttpMethod::kOptions, kMcpPath, handle_preflight);
}

}  // namespace core
