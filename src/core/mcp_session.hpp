#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "core/json_rpc.hpp"
#include "core/tool_dispatcher.hpp"
#include "nlohmann/json.hpp"

namespace core::mcp {

enum class SessionState { kUninitialized = 0, kReady };

// Newest first. The first entry is offered when the client asks for a version
// we do not speak.
const std::vector<std::string>& SupportedProtocolVersions();

// Protocol state of one client connection. tools/* requests are refused until
// initialize has succeeded; after that the session only routes requests.
class Session {
 public:
  explicit Session(const ToolDispatcher& dispatcher);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Handles one JSON-RPC message. Returns std::nullopt for notifications.
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

  SessionState State() const { return state_.load(); }
  bool IsReady() const { return State() == SessionState::kReady; }

 private:
  nlohmann::json Dispatch(const JsonRpcRequest& request);
  nlohmann::json HandleInitialize(const nlohmann::json& params);
  nlohmann::json HandleToolsList() const;
  nlohmann::json HandleToolsCall(const nlohmann::json& params) const;
  void RequireReady() const;

  const ToolDispatcher& dispatcher_;
  std::atomic<SessionState> state_{SessionState::kUninitialized};
};

}  // namespace core::mcp
