#include "core/weather_format.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

#include "core/errors.hpp"
#include "core/weather_codes.hpp"

namespace core::weather {
namespace {

using nlohmann::json;

const json& RequireBlock(const json& response, const std::string& block) {
  if (!response.is_object()) {
    throw ProviderDataError("Provider response is not a JSON object");
  }
  const auto it = response.find(block);
  if (it == response.end() || !it->is_object()) {
    throw ProviderDataError("Provider response is missing '" + block + "'");
  }
  return *it;
}

const json& RequireNumber(const json& object, const std::string& block,
                          const std::string& field) {
  const auto it = object.find(field);
  if (it == object.end() || !it->is_number()) {
    throw ProviderDataError("Provider response is missing '" + block + "." + field + "'");
  }
  return *it;
}

const json& RequireSeries(const json& daily, const std::string& field) {
  const auto it = daily.find(field);
  if (it == daily.end() || !it->is_array()) {
    throw ProviderDataError("Provider response is missing 'daily." + field + "'");
  }
  if (it->size() < kDailyWindow) {
    throw ProviderDataError("Provider returned " + std::to_string(it->size()) +
                            " entries for 'daily." + field + "', expected " +
                            std::to_string(kDailyWindow));
  }
  return *it;
}

const json& RequireDayNumber(const json& series, const std::string& field, std::size_t day) {
  const auto& value = series.at(day);
  if (!value.is_number()) {
    throw ProviderDataError("Provider response has no value for 'daily." + field + "[" +
                            std::to_string(day) + "]'");
  }
  return value;
}

std::string RenderDays(const json& response, const std::string& heading) {
  const auto& daily = RequireBlock(response, "daily");
  const auto& time = RequireSeries(daily, "time");
  const auto& codes = RequireSeries(daily, "weather_code");
  const auto& minimum = RequireSeries(daily, "temperature_2m_min");
  const auto& maximum = RequireSeries(daily, "temperature_2m_max");
  const auto& precipitation = RequireSeries(daily, "precipitation_sum");

  std::ostringstream stream;
  stream << heading;
  for (std::size_t day = 0; day < kDailyWindow; ++day) {
    const auto& date = time.at(day);
    if (!date.is_string()) {
      throw ProviderDataError("Provider response has no date for 'daily.time[" +
                              std::to_string(day) + "]'");
    }
    stream << '\n'
           << date.get<std::string>() << ": " << DescribeWeatherCodeValue(codes.at(day)) << ", "
           << FormatMeasurement(RequireDayNumber(minimum, "temperature_2m_min", day), "°C")
           << " tot "
           << FormatMeasurement(RequireDayNumber(maximum, "temperature_2m_max", day), "°C")
           << ", neerslag "
           << FormatMeasurement(RequireDayNumber(precipitation, "precipitation_sum", day), " mm");
  }
  return stream.str();
}

}  // namespace

std::string FormatMeasurement(const json& value, const std::string& unit) {
  return value.dump() + unit;
}

std::string DescribeWeatherCodeValue(const json& value) {
  if (value.is_number_integer()) {
    const auto code = value.get<std::int64_t>();
    if (code >= std::numeric_limits<int>::min() && code <= std::numeric_limits<int>::max()) {
      return std::string{DescribeWeatherCode(static_cast<int>(code))};
    }
  } else if (value.is_number_float()) {
    const double code = value.get<double>();
    if (std::isfinite(code) && std::floor(code) == code && std::fabs(code) < 1e9) {
      return std::string{DescribeWeatherCode(static_cast<int>(code))};
    }
  }
  return std::string{kUnknownWeatherCode};
}

std::string RenderTemperature(const json& response) {
  const auto& current = RequireBlock(response, "current");
  return "Huidige temperatuur: " +
         FormatMeasurement(RequireNumber(current, "current", "temperature_2m"), "°C");
}

std::string RenderCurrentWeather(const json& response) {
  const auto& current = RequireBlock(response, "current");
  const auto& temperature = RequireNumber(current, "current", "temperature_2m");
  const auto& humidity = RequireNumber(current, "current", "relative_humidity_2m");
  const auto& wind = RequireNumber(current, "current", "wind_speed_10m");
  const auto& code = RequireNumber(current, "current", "weather_code");

  std::ostringstream stream;
  stream << "Huidig weer: " << DescribeWeatherCodeValue(code) << '\n'
         << "Temperatuur: " << FormatMeasurement(temperature, "°C") << '\n'
         << "Luchtvochtigheid: " << FormatMeasurement(humidity, "%") << '\n'
         << "Wind: " << FormatMeasurement(wind, " km/u");
  return stream.str();
}

std::string RenderForecast(const json& response) {
  return RenderDays(response, "Weersverwachting voor de komende " +
                                  std::to_string(kDailyWindow) + " dagen:");
}

std::string RenderPastWeather(const json& response) {
  return RenderDays(response, "Weer van de afgelopen " + std::to_string(kDailyWindow) +
                                  " dagen:");
}

}  // namespace core::weather
