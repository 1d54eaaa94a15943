#pragma once

#include <iosfwd>

#include "core/mcp_session.hpp"

namespace core::mcp {

// Serves one session over newline-delimited JSON-RPC until `in` reaches EOF.
// Returns the number of messages that could not be parsed.
int RunStdio(std::istream& in, std::ostream& out, Session& session);

}  // namespace core::mcp
