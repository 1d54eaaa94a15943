#include "core/tool_dispatcher.hpp"

#include <chrono>
#include <utility>

#include "core/argument_validation.hpp"
#include "core/logging.hpp"

namespace core::mcp {
namespace {

using core::logging::LogError;
using core::logging::LogInfo;
using core::logging::LogWarn;

constexpr const char* kProviderUnavailable =
    "The weather service could not be reached. Please try again later.";

}  // namespace

ToolResult ToolResult::Text(std::string text) {
  ToolResult result;
  result.content.push_back(std::move(text));
  return result;
}

ToolResult ToolResult::Error(ToolErrorKind kind, std::string message) {
  ToolResult result;
  result.content.push_back(std::move(message));
  result.is_error = true;
  result.error_kind = kind;
  return result;
}

nlohmann::json ToolResult::ToJson() const {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto& text : content) {
    blocks.push_back({{"type", "text"}, {"text", text}});
  }
  return {{"content", blocks}, {"isError", is_error}};
}

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry,
                               const weather::WeatherProvider& provider, DispatchContext context)
    : registry_(registry), provider_(provider), context_(std::move(context)) {}

ToolResult ToolDispatcher::Invoke(const std::string& name, const nlohmann::json& arguments) const {
  const ToolEntry* tool = registry_.Find(name);
  if (tool == nullptr) {
    LogWarn("tools/call rejected unknown tool '" + name + "'");
    return ToolResult::Error(ToolErrorKind::kUnknownTool, "Unknown tool: " + name);
  }

  const auto started = std::chrono::steady_clock::now();
  ToolResult result = Run(*tool, arguments);
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
  LogInfo("tools/call " + name + " finished in " + std::to_string(elapsed_ms) + " ms" +
          (result.is_error ? " with error " + std::string{ToString(*result.error_kind)} : ""));
  return result;
}

ToolResult ToolDispatcher::Run(const ToolEntry& tool, const nlohmann::json& arguments) const {
  try {
    const auto validated = ValidateArguments(tool.definition.input_schema, arguments);
    const auto location = ResolveLocation(validated, context_.default_location);
    const auto response = provider_.Fetch(BuildQuery(tool, location));
    return ToolResult::Text(tool.render(response));
  } catch (const ArgumentError& ex) {
    return ToolResult::Error(ToolErrorKind::kInvalidArguments,
                             "Invalid arguments for " + tool.definition.name + ": " + ex.what());
  } catch (const ProviderTransportError& ex) {
    LogWarn(tool.definition.name + ": " + ex.what());
    return ToolResult::Error(ToolErrorKind::kProviderTransport, kProviderUnavailable);
  } catch (const ProviderDataError& ex) {
    LogWarn(tool.definition.name + ": " + ex.what());
    return ToolResult::Error(ToolErrorKind::kProviderDataShape,
                             std::string{"The weather service returned incomplete data: "} +
                                 ex.what());
  } catch (const std::exception& ex) {
    LogError(tool.definition.name + " failed unexpectedly: " + ex.what());
    return ToolResult::Error(ToolErrorKind::kInternal,
                             "Internal error while running " + tool.definition.name);
  }
}

weather::ProviderQuery ToolDispatcher::BuildQuery(const ToolEntry& tool,
                                                  const Location& location) const {
  weather::ProviderQuery query;
  query.latitude = location.latitude;
  query.longitude = location.longitude;
  query.current_fields = tool.fields.current;
  query.daily_fields = tool.fields.daily;
  query.timezone = context_.timezone;
  query.past_days = tool.fields.past_days;
  query.forecast_days = tool.fields.forecast_days;
  return query;
}

}  // namespace core::mcp
