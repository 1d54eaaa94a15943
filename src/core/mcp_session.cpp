#include "core/mcp_session.hpp"

#include <algorithm>

#include "core/config.hpp"
#include "core/logging.hpp"

namespace core::mcp {
namespace {

using core::logging::LogDebug;
using core::logging::LogError;
using core::logging::LogInfo;
using nlohmann::json;

std::string NegotiateProtocolVersion(const json& params) {
  const auto& supported = SupportedProtocolVersions();
  if (const auto requested = params.find("protocolVersion");
      requested != params.end() && requested->is_string()) {
    const auto version = requested->get<std::string>();
    if (std::find(supported.begin(), supported.end(), version) != supported.end()) {
      return version;
    }
  }
  return supported.front();
}

}  // namespace

const std::vector<std::string>& SupportedProtocolVersions() {
  static const std::vector<std::string> kVersions = {"2025-03-26", "2024-11-05"};
  return kVersions;
}

Session::Session(const ToolDispatcher& dispatcher) : dispatcher_(dispatcher) {}

std::optional<json> Session::HandleMessage(const json& message) {
  JsonRpcRequest request;
  try {
    request = ParseRequest(message);
  } catch (const JsonRpcError& ex) {
    json id = nullptr;
    if (message.is_object()) {
      if (const auto it = message.find("id"); it != message.end() &&
                                              (it->is_string() || it->is_number_integer())) {
        id = *it;
      }
    }
    return MakeErrorPayload(id, ex.Code(), ex.what());
  }

  if (request.IsNotification()) {
    LogDebug("Notification " + request.method);
    return std::nullopt;
  }

  const json& id = *request.id;
  try {
    return MakeResultPayload(id, Dispatch(request));
  } catch (const JsonRpcError& ex) {
    return MakeErrorPayload(id, ex.Code(), ex.what());
  } catch (const std::exception& ex) {
    LogError("Failed to handle " + request.method + ": " + ex.what());
    return MakeErrorPayload(id, kInternalError, "Internal error");
  }
}

json Session::Dispatch(const JsonRpcRequest& request) {
  if (request.method == "initialize") {
    return HandleInitialize(request.params);
  }
  if (request.method == "ping") {
    return json::object();
  }
  if (request.method == "tools/list") {
    RequireReady();
    return HandleToolsList();
  }
  if (request.method == "tools/call") {
    RequireReady();
    return HandleToolsCall(request.params);
  }
  throw JsonRpcError(kMethodNotFound, "Method not found: " + request.method);
}

json Session::HandleInitialize(const json& params) {
  if (!params.is_object()) {
    throw JsonRpcError(kInvalidParams, "initialize params must be an object");
  }

  if (state_.exchange(SessionState::kReady) != SessionState::kReady) {
    std::string client_name = "unknown client";
    if (const auto client = params.find("clientInfo");
        client != params.end() && client->is_object()) {
      if (const auto name = client->find("name"); name != client->end() && name->is_string()) {
        client_name = name->get<std::string>();
      }
    }
    LogInfo("Session initialized by " + client_name);
  }

  return {{"protocolVersion", NegotiateProtocolVersion(params)},
          {"capabilities", {{"tools", json::object()}}},
          {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

json Session::HandleToolsList() const {
  return {{"tools", dispatcher_.Registry().ToolSchemasJson()}};
}

json Session::HandleToolsCall(const json& params) const {
  if (!params.is_object()) {
    throw JsonRpcError(kInvalidParams, "tools/call params must be an object");
  }
  const auto name = params.find("name");
  if (name == params.end() || !name->is_string()) {
    throw JsonRpcError(kInvalidParams, "tools/call requires a string 'name'");
  }
  const auto arguments = params.find("arguments");
  const json args = (arguments != params.end()) ? *arguments : json::object();
  return dispatcher_.Invoke(name->get<std::string>(), args).ToJson();
}

void Session::RequireReady() const {
  if (!IsReady()) {
    throw JsonRpcError(kServerNotInitialized,
                       "Server not initialized: send initialize before tools requests");
  }
}

}  // namespace core::mcp
