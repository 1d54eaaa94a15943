#pragma once

#include "core/config.hpp"
#include "nlohmann/json.hpp"

namespace core::mcp {

// Checks tool arguments against the subset of JSON Schema used by our tool
// definitions: object type, required, per-property type, minimum/maximum and
// additionalProperties. Returns the arguments as an object (null becomes {}).
// Throws core::ArgumentError naming the offending field.
nlohmann::json ValidateArguments(const nlohmann::json& schema, const nlohmann::json& arguments);

// Uses latitude/longitude from validated arguments when both are present,
// otherwise the fallback. Supplying only one of them is an ArgumentError.
Location ResolveLocation(const nlohmann::json& arguments, const Location& fallback);

}  // namespace core::mcp
