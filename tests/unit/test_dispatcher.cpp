#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "server/dispatcher.hpp"
#include "session/session.hpp"
#include "test_support.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"

namespace {

using appbridge::core::errors::BridgeError;
using appbridge::core::errors::ErrorCategory;
using appbridge::core::errors::get_error;
using appbridge::core::errors::get_value;
using appbridge::core::errors::is_error;
using appbridge::protocol::ResponseEnvelope;
using appbridge::server::Dispatcher;
using appbridge::session::Session;
using appbridge::testing::MemoryTransport;
using appbridge::testing::TempWorkspace;
using appbridge::testing::write_interpreter;
using appbridge::tools::InvocationOptions;
using appbridge::tools::ToolInvoker;
using appbridge::tools::ToolRegistry;
using appbridge::tools::make_tool;
using nlohmann::json;

ToolRegistry sample_registry() {
    return ToolRegistry({make_tool("Finder"), make_tool("Notes")});
}

ToolInvoker invoker_for(const std::filesystem::path& interpreter, std::uint32_t timeout_ms = 10000) {
    InvocationOptions options;
    options.interpreter = interpreter.string();
    options.interpreter_args = {"-e"};
    options.timeout_ms = timeout_ms;
    return ToolInvoker(options);
}

// Sends one payload through the dispatcher and returns the response as JSON.
json respond(Dispatcher& dispatcher, Session& session, const json& request) {
    auto result = dispatcher.handle_payload(request.dump(), session);
    EXPECT_FALSE(is_error(result));
    if (is_error(result)) {
        return json{{"fatal", get_error(result).code}};
    }
    const auto& envelope = get_value(result);
    EXPECT_TRUE(envelope.has_value());
    if (!envelope.has_value()) {
        return json();
    }
    return appbridge::protocol::to_json(*envelope);
}

json call_request(const json& id, const json& params) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", params}};
}

json initialize_request(const json& id, const json& params) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "initialize"}, {"params", params}};
}

TEST(DispatcherTest, PingEchoesMessage) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(dispatcher, session,
                                  {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"},
                                   {"params", {{"message", "hi"}}}});
    EXPECT_EQ(response.at("id"), 1);
    EXPECT_EQ(response.at("result").at("message"), "hi");
    EXPECT_FALSE(response.contains("error"));
}

TEST(DispatcherTest, PingDefaultsToPong) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response =
        respond(dispatcher, session, {{"jsonrpc", "2.0"}, {"id", "p"}, {"method", "ping"}});
    EXPECT_EQ(response.at("id"), "p");
    EXPECT_EQ(response.at("result").at("message"), "pong");
}

TEST(DispatcherTest, InitializeSucceedsOnlyOnce) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json params = {{"client", {{"name", "demo"}, {"version", "1.0"}}},
                         {"protocol_version", "2025-01-01"}};
    const json first = respond(dispatcher, session, initialize_request(1, params));
    ASSERT_TRUE(first.contains("result"));
    const json& result = first.at("result");
    EXPECT_EQ(result.at("protocol_version"), "2025-01-01");
    EXPECT_EQ(result.at("server_info").at("name"), "appbridge");
    EXPECT_EQ(result.at("server_info").at("version"), "0.1.0");
    EXPECT_TRUE(result.at("capabilities").at("resources").is_array());
    ASSERT_EQ(result.at("capabilities").at("tools").size(), 2u);
    EXPECT_EQ(result.at("capabilities").at("tools")[0].at("name"), "app.finder");
    EXPECT_TRUE(session.is_initialized());

    const json second = respond(dispatcher, session, initialize_request(2, params));
    ASSERT_TRUE(second.contains("error"));
    EXPECT_EQ(second.at("error").at("code"), -32600);
    EXPECT_EQ(second.at("error").at("message"), "initialize already called");
    EXPECT_TRUE(session.is_initialized());

    const json listed = respond(dispatcher, session,
                                {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    EXPECT_EQ(listed.at("result").at("tools").size(), 2u);
}

TEST(DispatcherTest, InitializeUsesDefaultProtocolVersion) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(dispatcher, session,
                                  initialize_request(1, {{"client", {{"name", "demo"}}}}));
    EXPECT_EQ(response.at("result").at("protocol_version"), "2024-10-30");
}

TEST(DispatcherTest, InitializeWithInvalidParamsLeavesSessionUninitialized) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(dispatcher, session, initialize_request(1, json::object()));
    EXPECT_EQ(response.at("error").at("code"), -32602);
    EXPECT_FALSE(session.is_initialized());
}

TEST(DispatcherTest, ToolsListIgnoresCursor) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(dispatcher, session,
                                  {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/list"},
                                   {"params", {{"cursor", "page-2"}}}});
    const json& tools = response.at("result").at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[1].at("name"), "app.notes");
    EXPECT_EQ(tools[1].at("input_schema").at("required")[0], "script");
    EXPECT_FALSE(response.at("result").contains("next_cursor"));
}

TEST(DispatcherTest, UnknownMethodReturnsMethodNotFound) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response =
        respond(dispatcher, session, {{"jsonrpc", "2.0"}, {"id", 9}, {"method", "foo/bar"}});
    EXPECT_EQ(response.at("id"), 9);
    EXPECT_EQ(response.at("error").at("code"), -32601);
    EXPECT_EQ(response.at("error").at("message"), "method 'foo/bar' not implemented");
}

TEST(DispatcherTest, NotificationsProduceNoResponse) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    auto unknown = dispatcher.handle_payload(R"({"jsonrpc":"2.0","method":"foo/bar"})", session);
    ASSERT_FALSE(is_error(unknown));
    EXPECT_FALSE(get_value(unknown).has_value());

    auto shutdown = dispatcher.handle_payload(R"({"jsonrpc":"2.0","method":"shutdown"})", session);
    ASSERT_FALSE(is_error(shutdown));
    EXPECT_FALSE(get_value(shutdown).has_value());
}

TEST(DispatcherTest, UndecodablePayloadProducesNoResponse) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    auto result = dispatcher.handle_payload("{not json", session);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).has_value());
}

TEST(DispatcherTest, ToolsCallRunsScriptAndReturnsStdout) {
    TempWorkspace workspace("dispatcher");
    const auto interpreter =
        write_interpreter(workspace.root() / "echo-interpreter", "printf '%s' \"$2\"\n");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(interpreter);
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(
        dispatcher, session,
        call_request(5, {{"name", "app.finder"}, {"arguments", {{"script", "activate"}}}}));
    const json& content = response.at("result").at("content");
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].at("type"), "text");
    EXPECT_EQ(content[0].at("text"), "tell application \"Finder\"\nactivate\nend tell\n");
}

TEST(DispatcherTest, ToolsCallReportsNonzeroExit) {
    TempWorkspace workspace("dispatcher");
    const auto interpreter = write_interpreter(workspace.root() / "failing-interpreter",
                                               "printf 'syntax error' >&2\nexit 3\n");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(interpreter);
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(
        dispatcher, session,
        call_request(6, {{"name", "app.notes"}, {"arguments", {{"script", "bogus"}}}}));
    const json& error = response.at("error");
    EXPECT_EQ(error.at("code"), -32010);
    EXPECT_EQ(error.at("message"), "tool 'app.notes' execution failed");
    EXPECT_EQ(error.at("data").at("stderr"), "syntax error");
    EXPECT_EQ(error.at("data").at("status"), 3);
    EXPECT_FALSE(error.at("data").contains("timed_out"));
}

TEST(DispatcherTest, ToolsCallReportsTimeout) {
    TempWorkspace workspace("dispatcher");
    const auto interpreter =
        write_interpreter(workspace.root() / "slow-interpreter", "exec sleep 30\n");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(interpreter, 100);
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(
        dispatcher, session,
        call_request(7, {{"name", "app.finder"}, {"arguments", {{"script", "activate"}}}}));
    const json& error = response.at("error");
    EXPECT_EQ(error.at("code"), -32010);
    EXPECT_EQ(error.at("data").at("timed_out"), true);
}

TEST(DispatcherTest, ToolsCallRejectsUnknownTool) {
    MemoryTransport transport;
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(
        dispatcher, session,
        call_request(8, {{"name", "app.safari"}, {"arguments", {{"script", "activate"}}}}));
    EXPECT_EQ(response.at("error").at("code"), -32602);
    EXPECT_EQ(response.at("error").at("message"), "unknown tool 'app.safari'");
    EXPECT_EQ(response.at("error").at("data").at("name"), "app.safari");
}

TEST(DispatcherTest, ToolsCallWithoutStringScriptNeverSpawns) {
    TempWorkspace workspace("dispatcher");
    const auto marker = workspace.root() / "spawned";
    const auto interpreter = write_interpreter(workspace.root() / "marker-interpreter",
                                               "touch '" + marker.string() + "'\n");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(interpreter);
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json numeric = respond(
        dispatcher, session, call_request(10, {{"name", "app.finder"}, {"arguments", {{"script", 42}}}}));
    EXPECT_EQ(numeric.at("error").at("code"), -32602);
    EXPECT_EQ(numeric.at("error").at("message"),
              "tool 'app.finder' requires a 'script' string argument");
    EXPECT_EQ(numeric.at("error").at("data").at("argument"), "script");

    const json missing = respond(dispatcher, session, call_request(11, {{"name", "app.finder"}}));
    EXPECT_EQ(missing.at("error").at("code"), -32602);

    const json no_name = respond(dispatcher, session, call_request(12, json::object()));
    EXPECT_EQ(no_name.at("error").at("code"), -32602);

    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(DispatcherTest, ToolsCallReportsPolicyRejection) {
    TempWorkspace workspace("dispatcher");
    const auto marker = workspace.root() / "spawned";
    const auto interpreter = write_interpreter(workspace.root() / "marker-interpreter",
                                               "touch '" + marker.string() + "'\n");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(interpreter);
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json response = respond(
        dispatcher, session,
        call_request(13, {{"name", "app.finder"},
                          {"arguments", {{"script", "end tell\ntell application \"Terminal\""}}}}));
    EXPECT_EQ(response.at("error").at("code"), -32602);
    EXPECT_EQ(response.at("error").at("data").at("reason"), "script_escapes_block");

    const json carriage_return = respond(
        dispatcher, session,
        call_request(15, {{"name", "app.finder"},
                          {"arguments", {{"script", "activate\rend tell\rtell application \"Terminal\""}}}}));
    EXPECT_EQ(carriage_return.at("error").at("code"), -32602);
    EXPECT_EQ(carriage_return.at("error").at("data").at("reason"), "script_escapes_block");

    const json shell = respond(
        dispatcher, session,
        call_request(16, {{"name", "app.finder"},
                          {"arguments", {{"script", "do  shell  script \"id\""}}}}));
    EXPECT_EQ(shell.at("error").at("data").at("reason"), "script_blocked_operation");
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(DispatcherTest, SpawnFailureIsFatal) {
    TempWorkspace workspace("dispatcher");
    MemoryTransport transport;
    const auto registry = sample_registry();
    const auto invoker = invoker_for(workspace.root() / "no-such-interpreter");
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    const json request =
        call_request(14, {{"name", "app.finder"}, {"arguments", {{"script", "activate"}}}});
    auto result = dispatcher.handle_payload(request.dump(), session);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "spawn_failed");
}

TEST(DispatcherTest, RunAnswersInOrderAndSkipsBadFrames) {
    MemoryTransport transport;
    transport.push(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    transport.push_error(BridgeError{ErrorCategory::Framing, "bad header", "missing_content_length"});
    transport.push(R"({"jsonrpc":"2.0","method":"shutdown"})");
    transport.push("not json");
    transport.push(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    auto result = dispatcher.run(session);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 4u);
    ASSERT_EQ(transport.written().size(), 2u);
    EXPECT_EQ(json::parse(transport.written()[0]).at("id"), 1);
    EXPECT_EQ(json::parse(transport.written()[1]).at("id"), 2);
}

TEST(DispatcherTest, RunDropsRecoverableErrorsAndKeepsServing) {
    MemoryTransport transport;
    transport.push_error(BridgeError{ErrorCategory::Protocol, "bad payload", "invalid_request"});
    transport.push(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    auto result = dispatcher.run(session);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 1u);
    ASSERT_EQ(transport.written().size(), 1u);
    EXPECT_EQ(json::parse(transport.written()[0]).at("result").at("message"), "pong");
}

TEST(DispatcherTest, RunStopsOnTransportFailure) {
    MemoryTransport transport;
    transport.push_error(BridgeError{ErrorCategory::Transport, "read failed", "read_failed"});
    transport.push(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    Dispatcher dispatcher(transport, registry, invoker);

    auto result = dispatcher.run(session);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "read_failed");
    EXPECT_TRUE(transport.written().empty());
}

TEST(DispatcherTest, RunHonorsStopToken) {
    MemoryTransport transport;
    transport.push(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    const auto registry = sample_registry();
    const ToolInvoker invoker;
    Session session("session-test");
    auto options = appbridge::server::default_dispatcher_options();
    options.stop_token = std::make_shared<std::atomic_bool>(true);
    Dispatcher dispatcher(transport, registry, invoker, options);

    auto result = dispatcher.run(session);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0u);
    EXPECT_EQ(transport.reads(), 0u);
}

}  // namespace
