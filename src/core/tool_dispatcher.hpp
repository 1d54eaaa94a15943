#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/tool_registry.hpp"
#include "core/weather_provider.hpp"
#include "nlohmann/json.hpp"

namespace core::mcp {

struct ToolResult {
  std::vector<std::string> content;
  bool is_error = false;
  std::optional<ToolErrorKind> error_kind;

  static ToolResult Text(std::string text);
  static ToolResult Error(ToolErrorKind kind, std::string message);

  // {"content":[{"type":"text","text":...}],"isError":...}
  nlohmann::json ToJson() const;
};

struct DispatchContext {
  Location default_location;
  std::string timezone;
};

// Routes tools/call to the registry entry, runs validate -> query -> render and
// turns every failure into an error ToolResult. Holds only references to
// immutable state, so one instance serves all sessions concurrently.
class ToolDispatcher {
 public:
  ToolDispatcher(const ToolRegistry& registry, const weather::WeatherProvider& provider,
                 DispatchContext context);

  ToolResult Invoke(const std::string& name, const nlohmann::json& arguments) const;

  // Exposed for tests: the provider query a validated call would send.
  weather::ProviderQuery BuildQuery(const ToolEntry& tool, const Location& location) const;

  const ToolRegistry& Registry() const { return registry_; }

 private:
  ToolResult Run(const ToolEntry& tool, const nlohmann::json& arguments) const;

  const ToolRegistry& registry_;
  const weather::WeatherProvider& provider_;
  DispatchContext context_;
};

}  // namespace core::mcp
