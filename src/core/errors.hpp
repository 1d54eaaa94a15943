#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace core {

enum class ToolErrorKind {
  kUnknownTool = 0,
  kInvalidArguments,
  kProviderTransport,
  kProviderDataShape,
  kInternal,
};

inline std::string_view ToString(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::kUnknownTool:
      return "unknown_tool";
    case ToolErrorKind::kInvalidArguments:
      return "invalid_arguments";
    case ToolErrorKind::kProviderTransport:
      return "provider_transport";
    case ToolErrorKind::kProviderDataShape:
      return "provider_data_shape";
    case ToolErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

// Tool arguments do not satisfy the tool's input schema.
class ArgumentError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// The provider could not be reached, timed out, or answered with a non-2xx status.
class ProviderTransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The provider answered, but the body lacks a field or sub-object we render.
class ProviderDataError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace core
