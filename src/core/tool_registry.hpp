#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "nlohmann/json.hpp"

namespace core::mcp {

struct ToolDefinition {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

// Provider fields a tool asks for. Daily tools also fix the day window.
struct ProviderFields {
  std::vector<std::string> current;
  std::vector<std::string> daily;
  int past_days = 0;
  int forecast_days = 0;
};

using RenderFunction = std::string (*)(const nlohmann::json& response);

struct ToolEntry {
  ToolDefinition definition;
  ProviderFields fields;
  RenderFunction render = nullptr;
};

// Immutable after construction; safe to share between sessions and threads.
class ToolRegistry {
 public:
  explicit ToolRegistry(std::vector<ToolEntry> entries);

  std::vector<ToolDefinition> List() const;
  const ToolEntry* Find(const std::string& name) const;

  nlohmann::json ToolSchemasJson() const;

 private:
  std::vector<ToolEntry> entries_;
};

ToolRegistry BuildWeatherToolRegistry(const Location& default_location);

}  // namespace core::mcp
