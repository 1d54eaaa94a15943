#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/json_rpc.hpp"
#include "core/mcp_session.hpp"
#include "core/session_registry.hpp"
#include "core/stdio_transport.hpp"
#include "core/tool_dispatcher.hpp"
#include "core/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using test_support::Assert;
using test_support::Contains;
using test_support::ScriptedProvider;

const core::Location kHome{51.836316614873176, 5.79300494667676};

json Request(int id, const std::string& method, const json& params = json::object()) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

json InitializeRequest(int id) {
  return Request(id, "initialize",
                 {{"protocolVersion", "2024-11-05"},
                  {"capabilities", json::object()},
                  {"clientInfo", {{"name", "session-test"}, {"version", "1.0"}}}});
}

json CallRequest(int id, const std::string& tool, const json& arguments = json::object()) {
  return Request(id, "tools/call", {{"name", tool}, {"arguments", arguments}});
}

int ErrorCode(const json& response) { return response.at("error").at("code").get<int>(); }

struct Fixture {
  Fixture()
      : registry(core::mcp::BuildWeatherToolRegistry(kHome)),
        provider([](const core::weather::ProviderQuery&) {
          return test_support::CurrentResponse({{"temperature_2m", 8.5}});
        }),
        dispatcher(registry, provider, {kHome, "Europe/Amsterdam"}) {}

  core::mcp::ToolRegistry registry;
  ScriptedProvider provider;
  core::mcp::ToolDispatcher dispatcher;
};

void TestHandshakeIsIdempotent() {
  Fixture fixture;
  core::mcp::Session session(fixture.dispatcher);
  Assert(session.State() == core::mcp::SessionState::kUninitialized, "fresh session state");

  const auto first = session.HandleMessage(InitializeRequest(1));
  const auto second = session.HandleMessage(InitializeRequest(1));
  Assert(first.has_value() && second.has_value(), "initialize must be answered");
  Assert(first->dump() == second->dump(), "repeated initialize must be byte-identical");
  Assert(session.IsReady(), "session ready after initialize");

  const auto& result = first->at("result");
  Assert(result.at("protocolVersion") == "2024-11-05", "supported version echoed");
  Assert(result.at("capabilities").at("tools").is_object(), "tools capability advertised");
  Assert(result.at("serverInfo").at("name") == "weather-mcp", "server name");
  Assert(result.at("serverInfo").at("version") == core::kServerVersion, "server version");

  const auto future = session.HandleMessage(
      Request(2, "initialize", {{"protocolVersion", "2099-01-01"}}));
  Assert(future->at("result").at("protocolVersion") ==
             core::mcp::SupportedProtocolVersions().front(),
         "unsupported version falls back to the newest supported one");
}

void TestToolsRequireInitialize() {
  Fixture fixture;
  for (const std::string tool : {"get_temperature", "get_forecast", "no_such_tool"}) {
    core::mcp::Session session(fixture.dispatcher);
    const auto response = session.HandleMessage(CallRequest(7, tool));
    Assert(response.has_value(), "sequencing error must be answered");
    Assert(ErrorCode(*response) == core::mcp::kServerNotInitialized,
           "tools/call before initialize must fail for " + tool);
    Assert(response->at("id") == 7, "error echoes the request id");
  }

  core::mcp::Session session(fixture.dispatcher);
  const auto listed = session.HandleMessage(Request(1, "tools/list"));
  Assert(ErrorCode(*listed) == core::mcp::kServerNotInitialized, "tools/list before initialize");
  Assert(fixture.provider.calls == 0, "no provider call before initialize");

  const auto pong = session.HandleMessage(Request(2, "ping"));
  Assert(pong->at("result").empty(), "ping works in any state");

  session.HandleMessage(InitializeRequest(3));
  const auto after = session.HandleMessage(CallRequest(4, "get_temperature"));
  Assert(after->contains("result"), "session usable after a late initialize");
  Assert(Contains(after->at("result").at("content").at(0).at("text").get<std::string>(), "8.5°C"),
         "temperature result text");
}

void TestToolsListAndCall() {
  Fixture fixture;
  core::mcp::Session session(fixture.dispatcher);
  session.HandleMessage(InitializeRequest(1));

  const auto listed = session.HandleMessage(Request(2, "tools/list"));
  const auto& tools = listed->at("result").at("tools");
  Assert(tools.size() == fixture.registry.List().size(), "every tool listed");
  Assert(tools.at(0).at("name") == "get_temperature", "registry order preserved");
  Assert(listed->dump() == session.HandleMessage(Request(2, "tools/list"))->dump(),
         "tools/list is deterministic");

  const auto unknown = session.HandleMessage(CallRequest(3, "get_humidity"));
  Assert(unknown->contains("result"), "unknown tool is a tool result, not a protocol error");
  Assert(unknown->at("result").at("isError") == true, "unknown tool flagged as error");
  Assert(Contains(unknown->at("result").at("content").at(0).at("text").get<std::string>(),
                  "Unknown tool: get_humidity"),
         "unknown tool diagnostic");

  const auto without_arguments =
      session.HandleMessage(Request(4, "tools/call", {{"name", "get_temperature"}}));
  Assert(without_arguments->at("result").at("isError") == false, "arguments are optional");

  const auto missing_name = session.HandleMessage(Request(5, "tools/call", {{"arguments", {}}}));
  Assert(ErrorCode(*missing_name) == core::mcp::kInvalidParams, "tools/call without a name");

  const auto unknown_method = session.HandleMessage(Request(6, "resources/list"));
  Assert(ErrorCode(*unknown_method) == core::mcp::kMethodNotFound, "unknown method");
}

void TestEnvelopeHandling() {
  Fixture fixture;
  core::mcp::Session session(fixture.dispatcher);

  const auto notification = session.HandleMessage(
      json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
  Assert(!notification.has_value(), "notifications are not answered");

  const auto wrong_version =
      session.HandleMessage(json{{"jsonrpc", "1.0"}, {"id", 9}, {"method", "ping"}});
  Assert(ErrorCode(*wrong_version) == core::mcp::kInvalidRequest, "jsonrpc version checked");
  Assert(wrong_version->at("id") == 9, "id recovered from an invalid request");

  const auto not_object = session.HandleMessage(json::array({1, 2}));
  Assert(ErrorCode(*not_object) == core::mcp::kInvalidRequest, "non-object message");
  Assert(not_object->at("id").is_null(), "null id when none can be recovered");

  const auto bad_params = session.HandleMessage(Request(1, "initialize", json::array()));
  Assert(ErrorCode(*bad_params) == core::mcp::kInvalidParams, "initialize params must be object");
  Assert(!session.IsReady(), "failed initialize leaves the session uninitialized");
}

void TestStdioTransport() {
  Fixture fixture;
  core::mcp::Session session(fixture.dispatcher);

  std::ostringstream script;
  script << InitializeRequest(1).dump() << '\n'
         << json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump() << '\n'
         << '\n'
         << "{not json\n"
         << CallRequest(2, "get_temperature").dump() << '\n';
  std::istringstream in(script.str());
  std::ostringstream out;

  const int malformed = core::mcp::RunStdio(in, out, session);
  Assert(malformed == 1, "one malformed line expected");

  std::vector<json> responses;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    responses.push_back(json::parse(line));
  }
  Assert(responses.size() == 3, "initialize, parse error and tools/call answered");
  Assert(responses[0].at("id") == 1 && responses[0].contains("result"), "initialize response");
  Assert(ErrorCode(responses[1]) == core::mcp::kParseError, "parse error response");
  Assert(responses[2].at("id") == 2, "tools/call response id");
  Assert(Contains(responses[2].at("result").at("content").at(0).at("text").get<std::string>(),
                  "8.5°C"),
         "tools/call over stdio");
}

void TestSessionRegistryLimits() {
  Fixture fixture;
  core::mcp::SessionRegistry sessions(fixture.dispatcher, 2, std::chrono::seconds(1800));
  const auto first = sessions.Open();
  const auto second = sessions.Open();
  Assert(first.has_value() && second.has_value(), "sessions below the limit open");
  Assert(first->id.size() == 32 && first->id != second->id, "distinct session ids");
  Assert(!sessions.Open().has_value(), "open beyond max_sessions refused");
  Assert(sessions.Find(first->id) == first->session, "find returns the opened session");
  Assert(sessions.Close(first->id), "close known session");
  Assert(!sessions.Close(first->id), "second close reports unknown");
  Assert(sessions.Find(first->id) == nullptr, "closed session not found");
  Assert(sessions.Open().has_value(), "closing frees a slot");
  Assert(sessions.Size() == 2, "two sessions open");
}

void TestSessionRegistryIdleExpiry() {
  Fixture fixture;
  core::mcp::SessionRegistry sessions(fixture.dispatcher, 4, std::chrono::seconds(1));
  const auto opened = sessions.Open();
  Assert(opened.has_value(), "session opens");
  Assert(sessions.Find(opened->id) != nullptr, "fresh session found");

  std::this_thread::sleep_for(std::chrono::milliseconds(2500));
  Assert(sessions.Find(opened->id) == nullptr, "idle session expired on lookup");
  Assert(sessions.Size() == 0, "expired session removed");
  Assert(!sessions.Close(opened->id), "expired session cannot be closed");
}

}  // namespace

int main() {
  try {
    TestHandshakeIsIdempotent();
    TestToolsRequireInitialize();
    TestToolsListAndCall();
    TestEnvelopeHandling();
    TestStdioTransport();
    TestSessionRegistryLimits();
    TestSessionRegistryIdleExpiry();
  } catch (const std::exception& ex) {
    std::cerr << "mcp_session_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
