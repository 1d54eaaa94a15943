#include "core/weather_codes.hpp"

#include <algorithm>
#include <array>

namespace core::weather {
namespace {

struct WeatherCodeEntry {
  int code;
  std::string_view description;
};

// Sorted by code.
constexpr std::array<WeatherCodeEntry, 28> kWeatherCodes = {{
    {0, "Onbewolkt"},
    {1, "Overwegend helder"},
    {2, "Half bewolkt"},
    {3, "Bewolkt"},
    {45, "Mist"},
    {48, "Mist met rijpvorming"},
    {51, "Lichte motregen"},
    {53, "Matige motregen"},
    {55, "Dichte motregen"},
    {56, "Lichte ijzel"},
    {57, "Dichte ijzel"},
    {61, "Lichte regen"},
    {63, "Matige regen"},
    {65, "Zware regen"},
    {66, "Lichte aanvriezende regen"},
    {67, "Zware aanvriezende regen"},
    {71, "Lichte sneeuwval"},
    {73, "Matige sneeuwval"},
    {75, "Zware sneeuwval"},
    {77, "Sneeuwkorrels"},
    {80, "Lichte regenbuien"},
    {81, "Matige regenbuien"},
    {82, "Zware regenbuien"},
    {85, "Lichte sneeuwbuien"},
    {86, "Zware sneeuwbuien"},
    {95, "Onweer"},
    {96, "Onweer met lichte hagel"},
    {99, "Onweer met zware hagel"},
}};

const WeatherCodeEntry* Find(int code) {
  const auto it = std::lower_bound(
      kWeatherCodes.begin(), kWeatherCodes.end(), code,
      [](const WeatherCodeEntry& entry, int value) { return entry.code < value; });
  if (it == kWeatherCodes.end() || it->code != code) {
    return nullptr;
  }
  return &*it;
}

}  // namespace

std::string_view DescribeWeatherCode(int code) {
  const auto* entry = Find(code);
  return entry ? entry->description : kUnknownWeatherCode;
}

bool IsKnownWeatherCode(int code) { return Find(code) != nullptr; }

}  // namespace core::weather
