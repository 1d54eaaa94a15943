#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace core::mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerNotInitialized = -32002;

// Carries a JSON-RPC error code out of a method handler.
class JsonRpcError : public std::runtime_error {
 public:
  JsonRpcError(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int Code() const { return code_; }

 private:
  int code_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  bool IsNotification() const { return !id.has_value(); }
};

// Throws JsonRpcError(kInvalidRequest) for a malformed envelope.
JsonRpcRequest ParseRequest(const nlohmann::json& message);

nlohmann::json MakeResultPayload(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeErrorPayload(const nlohmann::json& id, int code, const std::string& message);

}  // namespace core::mcp
