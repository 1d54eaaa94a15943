#include "core/weather_provider.hpp"

#include <utility>

#include "core/errors.hpp"
#include "core/logging.hpp"

namespace core::weather {
namespace {

std::string Join(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += value;
  }
  return joined;
}

}  // namespace

std::map<std::string, std::string> ToQueryParams(const ProviderQuery& query) {
  std::map<std::string, std::string> params = {
      {"latitude", FormatCoordinate(query.latitude)},
      {"longitude", FormatCoordinate(query.longitude)},
      {"timezone", query.timezone},
  };
  if (!query.current_fields.empty()) {
    params["current"] = Join(query.current_fields);
  }
  if (!query.daily_fields.empty()) {
    params["daily"] = Join(query.daily_fields);
    params["past_days"] = std::to_string(query.past_days);
    params["forecast_days"] = std::to_string(query.forecast_days);
  }
  return params;
}

OpenMeteoProvider::OpenMeteoProvider(std::string base_url, int timeout_seconds)
    : client_(std::move(base_url), timeout_seconds) {}

nlohmann::json OpenMeteoProvider::Fetch(const ProviderQuery& query) const {
  platform::HttpClientResponse response;
  try {
    response = client_.Get(kForecastPath, ToQueryParams(query));
  } catch (const platform::HttpTransportError& ex) {
    throw ProviderTransportError(ex.what());
  }

  if (response.status < 200 || response.status >= 300) {
    std::string reason;
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
      if (const auto it = body.find("reason"); it != body.end() && it->is_string()) {
        reason = it->get<std::string>();
      }
    }
    throw ProviderTransportError("Provider answered HTTP " + std::to_string(response.status) +
                                 (reason.empty() ? std::string{} : ": " + reason));
  }

  auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    throw ProviderDataError("Provider response is not valid JSON");
  }
  logging::LogDebug("Provider answered HTTP " + std::to_string(response.status) + " (" +
                    std::to_string(response.body.size()) + " bytes)");
  return parsed;
}

}  // namespace core::weather
