#include "core/tool_registry.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "core/weather_format.hpp"

namespace core::mcp {
namespace {

using nlohmann::json;

const std::vector<std::string> kDailyFields = {"weather_code", "temperature_2m_min",
                                               "temperature_2m_max", "precipitation_sum"};

json NoArgumentsSchema() {
  return {{"type", "object"}, {"properties", json::object()}, {"required", json::array()},
          {"additionalProperties", false}};
}

json LocationOverrideSchema() {
  return {{"type", "object"},
          {"properties",
           {{"latitude",
             {{"type", "number"},
              {"minimum", -90},
              {"maximum", 90},
              {"description", "Latitude to query instead of the default location."}}},
            {"longitude",
             {{"type", "number"},
              {"minimum", -180},
              {"maximum", 180},
              {"description", "Longitude to query instead of the default location."}}}}},
          {"required", json::array()},
          {"additionalProperties", false}};
}

json MakeToolSchemaJson(const ToolDefinition& tool) {
  return {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

}  // namespace

ToolRegistry::ToolRegistry(std::vector<ToolEntry> entries) : entries_(std::move(entries)) {
  std::unordered_set<std::string> names;
  for (const auto& entry : entries_) {
    if (entry.render == nullptr) {
      throw std::invalid_argument("Tool '" + entry.definition.name + "' has no renderer");
    }
    if (!names.insert(entry.definition.name).second) {
      throw std::invalid_argument("Duplicate tool name: " + entry.definition.name);
    }
  }
}

std::vector<ToolDefinition> ToolRegistry::List() const {
  std::vector<ToolDefinition> definitions;
  definitions.reserve(entries_.size());
  for (const auto& entry : entries_) {
    definitions.push_back(entry.definition);
  }
  return definitions;
}

const ToolEntry* ToolRegistry::Find(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (entry.definition.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

json ToolRegistry::ToolSchemasJson() const {
  json tools = json::array();
  for (const auto& entry : entries_) {
    tools.push_back(MakeToolSchemaJson(entry.definition));
  }
  return tools;
}

ToolRegistry BuildWeatherToolRegistry(const Location& default_location) {
  const std::string where = "(" + FormatCoordinate(default_location.latitude) + ", " +
                            FormatCoordinate(default_location.longitude) + ")";

  std::vector<ToolEntry> entries = {
      {{"get_temperature",
        "Get the current temperature for location " + where + " via the OpenMeteo API.",
        NoArgumentsSchema()},
       {{"temperature_2m"}, {}, 0, 0},
       &weather::RenderTemperature},
      {{"get_current_weather",
        "Get current conditions (description, temperature, humidity, wind) for location " +
            where + ", or for the given latitude/longitude.",
        LocationOverrideSchema()},
       {{"temperature_2m", "relative_humidity_2m", "wind_speed_10m", "weather_code"}, {}, 0, 0},
       &weather::RenderCurrentWeather},
      {{"get_forecast",
        "Get a " + std::to_string(weather::kDailyWindow) +
            "-day forecast (conditions, min/max temperature, precipitation) for location " +
            where + ", or for the given latitude/longitude.",
        LocationOverrideSchema()},
       {{}, kDailyFields, 0, static_cast<int>(weather::kDailyWindow)},
       &weather::RenderForecast},
      {{"get_past_weather",
        "Get the weather of the past " + std::to_string(weather::kDailyWindow) +
            " days for location " + where + ", or for the given latitude/longitude.",
        LocationOverrideSchema()},
       {{}, kDailyFields, static_cast<int>(weather::kDailyWindow), 0},
       &weather::RenderPastWeather},
  };
  return ToolRegistry(std::move(entries));
}

}  // namespace core::mcp
