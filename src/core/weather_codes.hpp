#pragma once

#include <string_view>

namespace core::weather {

inline constexpr std::string_view kUnknownWeatherCode = "Onbekend";

// Dutch description of a WMO weather interpretation code. Codes outside the
// table, which the provider may add at any time, map to kUnknownWeatherCode.
std::string_view DescribeWeatherCode(int code);

bool IsKnownWeatherCode(int code);

}  // namespace core::weather
