#include "core/session_registry.hpp"

#include <iomanip>
#include <sstream>

#include "core/logging.hpp"

namespace core::mcp {

SessionRegistry::SessionRegistry(const ToolDispatcher& dispatcher, std::size_t max_sessions,
                                 std::chrono::seconds idle_timeout)
    : dispatcher_(dispatcher),
      max_sessions_(max_sessions),
      idle_timeout_(idle_timeout),
      random_(std::random_device{}()) {}

std::optional<OpenedSession> SessionRegistry::Open() {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  PruneIdleLocked(now);
  if (sessions_.size() >= max_sessions_) {
    logging::LogWarn("Session limit reached (" + std::to_string(max_sessions_) + ")");
    return std::nullopt;
  }

  std::string id = NextIdLocked();
  while (sessions_.count(id) != 0) {
    id = NextIdLocked();
  }
  auto session = std::make_shared<Session>(dispatcher_);
  sessions_.emplace(id, Entry{session, now});
  logging::LogDebug("Opened session " + id + " (" + std::to_string(sessions_.size()) + " open)");
  return OpenedSession{id, session};
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  const auto now = std::chrono::steady_clock::now();
  if (now - it->second.last_used > idle_timeout_) {
    logging::LogInfo("Expiring idle session " + it->first);
    sessions_.erase(it);
    return nullptr;
  }
  it->second.last_used = now;
  return it->second.session;
}

bool SessionRegistry::Close(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool removed = sessions_.erase(id) > 0;
  if (removed) {
    logging::LogDebug("Closed session " + id);
  }
  return removed;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionRegistry::PruneIdleLocked(std::chrono::steady_clock::time_point now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now - it->second.last_used > idle_timeout_) {
      logging::LogInfo("Expiring idle session " + it->first);
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string SessionRegistry::NextIdLocked() {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0') << std::setw(16) << random_() << std::setw(16)
         << random_();
  return stream.str();
}

}  // namespace core::mcp
