#include "core/json_rpc.hpp"

namespace core::mcp {

JsonRpcRequest ParseRequest(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw JsonRpcError(kInvalidRequest, "Request must be a JSON object");
  }

  const auto version = message.find("jsonrpc");
  if (version == message.end() || !version->is_string() || *version != kJsonRpcVersion) {
    throw JsonRpcError(kInvalidRequest, "jsonrpc must be \"2.0\"");
  }

  const auto method = message.find("method");
  if (method == message.end() || !method->is_string()) {
    throw JsonRpcError(kInvalidRequest, "method must be a string");
  }

  JsonRpcRequest request;
  request.method = method->get<std::string>();
  request.params = nlohmann::json::object();

  if (const auto params = message.find("params"); params != message.end()) {
    if (!params->is_object() && !params->is_array() && !params->is_null()) {
      throw JsonRpcError(kInvalidRequest, "params must be an object or an array");
    }
    if (!params->is_null()) {
      request.params = *params;
    }
  }

  if (const auto id = message.find("id"); id != message.end()) {
    if (!id->is_null() && !id->is_string() && !id->is_number_integer()) {
      throw JsonRpcError(kInvalidRequest, "id must be a string, an integer or null");
    }
    request.id = *id;
  }
  return request;
}

nlohmann::json MakeResultPayload(const nlohmann::json& id, const nlohmann::json& result) {
  return {{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json MakeErrorPayload(const nlohmann::json& id, int code, const std::string& message) {
  return {{"jsonrpc", kJsonRpcVersion},
          {"id", id},
          {"error", {{"code", code}, {"message", message}}}};
}

}  // namespace core::mcp
