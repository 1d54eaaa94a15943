#pragma once

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

namespace core::weather {

// Number of daily entries rendered by the forecast and history tools.
inline constexpr std::size_t kDailyWindow = 5;

// Each renderer reads one provider response and returns display text. A missing
// block, field or day throws core::ProviderDataError; an unmapped weather code
// does not.
std::string RenderTemperature(const nlohmann::json& response);
std::string RenderCurrentWeather(const nlohmann::json& response);
std::string RenderForecast(const nlohmann::json& response);
std::string RenderPastWeather(const nlohmann::json& response);

// Numbers are written as the provider sent them, followed by the unit.
std::string FormatMeasurement(const nlohmann::json& value, const std::string& unit);
std::string DescribeWeatherCodeValue(const nlohmann::json& value);

}  // namespace core::weather
