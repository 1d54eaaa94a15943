#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "core/mcp_session.hpp"

namespace core::mcp {

struct OpenedSession {
  std::string id;
  std::shared_ptr<Session> session;
};

// Sessions of the HTTP transport, keyed by the Mcp-Session-Id header value.
// Sessions idle for longer than idle_timeout are dropped on the next Open(),
// and Find() no longer returns them.
class SessionRegistry {
 public:
  SessionRegistry(const ToolDispatcher& dispatcher, std::size_t max_sessions,
                  std::chrono::seconds idle_timeout);

  // std::nullopt when max_sessions are already open.
  std::optional<OpenedSession> Open();
  std::shared_ptr<Session> Find(const std::string& id);
  bool Close(const std::string& id);
  std::size_t Size() const;

  const ToolDispatcher& Dispatcher() const { return dispatcher_; }

 private:
  struct Entry {
    std::shared_ptr<Session> session;
    std::chrono::steady_clock::time_point last_used;
  };

  void PruneIdleLocked(std::chrono::steady_clock::time_point now);
  std::string NextIdLocked();

  const ToolDispatcher& dispatcher_;
  const std::size_t max_sessions_;
  const std::chrono::seconds idle_timeout_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> sessions_;
  std::mt19937_64 random_;
};

}  // namespace core::mcp
