#include "core/stdio_transport.hpp"

#include <istream>
#include <ostream>
#include <string>

#include "core/logging.hpp"

namespace core::mcp {
namespace {

void WriteMessage(std::ostream& out, const nlohmann::json& payload) {
  out << payload.dump() << '\n';
  out.flush();
}

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

int RunStdio(std::istream& in, std::ostream& out, Session& session) {
  int malformed = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (IsBlank(line)) {
      continue;
    }

    const auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
      ++malformed;
      logging::LogWarn("Discarding unparseable stdio message (" + std::to_string(line.size()) +
                       " bytes)");
      WriteMessage(out, MakeErrorPayload(nullptr, kParseError, "Parse error"));
      continue;
    }

    if (auto response = session.HandleMessage(message)) {
      WriteMessage(out, *response);
    }
  }
  logging::LogInfo("stdin closed, ending session");
  return malformed;
}

}  // namespace core::mcp
