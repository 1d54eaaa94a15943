#include "core/argument_validation.hpp"

#include <string>

#include "core/errors.hpp"

namespace core::mcp {
namespace {

using nlohmann::json;

std::string TypeName(const json& value) {
  if (value.is_number_integer()) {
    return "integer";
  }
  if (value.is_number()) {
    return "number";
  }
  return value.type_name();
}

bool MatchesType(const json& value, const std::string& type) {
  if (type == "string") {
    return value.is_string();
  }
  if (type == "number") {
    return value.is_number();
  }
  if (type == "integer") {
    return value.is_number_integer();
  }
  if (type == "boolean") {
    return value.is_boolean();
  }
  if (type == "object") {
    return value.is_object();
  }
  if (type == "array") {
    return value.is_array();
  }
  if (type == "null") {
    return value.is_null();
  }
  return true;
}

void CheckProperty(const std::string& name, const json& property_schema, const json& value) {
  if (const auto type = property_schema.find("type");
      type != property_schema.end() && type->is_string()) {
    const auto expected = type->get<std::string>();
    if (!MatchesType(value, expected)) {
      throw ArgumentError("Argument '" + name + "' must be of type " + expected + ", got " +
                          TypeName(value));
    }
  }
  if (!value.is_number()) {
    return;
  }
  const double number = value.get<double>();
  if (const auto minimum = property_schema.find("minimum");
      minimum != property_schema.end() && minimum->is_number() &&
      number < minimum->get<double>()) {
    throw ArgumentError("Argument '" + name + "' must be >= " + minimum->dump());
  }
  if (const auto maximum = property_schema.find("maximum");
      maximum != property_schema.end() && maximum->is_number() &&
      number > maximum->get<double>()) {
    throw ArgumentError("Argument '" + name + "' must be <= " + maximum->dump());
  }
}

}  // namespace

json ValidateArguments(const json& schema, const json& arguments) {
  if (arguments.is_null()) {
    return ValidateArguments(schema, json::object());
  }
  if (!arguments.is_object()) {
    throw ArgumentError("Arguments must be a JSON object, got " + TypeName(arguments));
  }

  const json empty = json::object();
  const auto properties_it = schema.find("properties");
  const json& properties =
      (properties_it != schema.end() && properties_it->is_object()) ? *properties_it : empty;

  if (const auto required = schema.find("required");
      required != schema.end() && required->is_array()) {
    for (const auto& name : *required) {
      if (name.is_string() && !arguments.contains(name.get<std::string>())) {
        throw ArgumentError("Missing required argument: " + name.get<std::string>());
      }
    }
  }

  const bool allow_additional = schema.value("additionalProperties", true);
  for (const auto& [name, value] : arguments.items()) {
    const auto property = properties.find(name);
    if (property == properties.end()) {
      if (!allow_additional) {
        throw ArgumentError("Unexpected argument: " + name);
      }
      continue;
    }
    CheckProperty(name, *property, value);
  }
  return arguments;
}

Location ResolveLocation(const json& arguments, const Location& fallback) {
  const bool has_latitude = arguments.contains("latitude");
  const bool has_longitude = arguments.contains("longitude");
  if (!has_latitude && !has_longitude) {
    return fallback;
  }
  if (has_latitude != has_longitude) {
    throw ArgumentError("Arguments 'latitude' and 'longitude' must be given together");
  }
  return Location{arguments.at("latitude").get<double>(), arguments.at("longitude").get<double>()};
}

}  // namespace core::mcp
