#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::weather {

inline constexpr const char* kForecastPath = "/v1/forecast";

struct ProviderQuery {
  double latitude = 0.0;
  double longitude = 0.0;
  std::vector<std::string> current_fields;
  std::vector<std::string> daily_fields;
  std::string timezone;
  int past_days = 0;
  int forecast_days = 0;
};

// Query parameters sent to the forecast endpoint for a query.
std::map<std::string, std::string> ToQueryParams(const ProviderQuery& query);

class WeatherProvider {
 public:
  virtual ~WeatherProvider() = default;

  // Performs one request. Throws core::ProviderTransportError when no usable
  // response arrives and core::ProviderDataError when the body is not JSON.
  virtual nlohmann::json Fetch(const ProviderQuery& query) const = 0;
};

class OpenMeteoProvider : public WeatherProvider {
 public:
  OpenMeteoProvider(std::string base_url, int timeout_seconds);

  nlohmann::json Fetch(const ProviderQuery& query) const override;

 private:
  platform::HttpClient client_;
};

}  // namespace core::weather
