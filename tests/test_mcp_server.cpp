// Tests for the MCP server: JSON-RPC dispatch, framing errors and the stdio loop.

#include "mcp/mcp_server.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using test_support::check;

namespace test_mcp_server {

static manifest::ToolDef make_tool(const std::string &name, const std::string &description,
                                   const std::string &command) {
    manifest::ToolDef tool;
    tool.name = name;
    tool.description = description;
    tool.runtime = manifest::Runtime::Cli;
    tool.command = command;
    tool.shell = "bash";
    tool.timeout_seconds = 10;
    return tool;
}

static mcp_server::ServerOptions test_options() {
    mcp_server::ServerOptions options;
    options.server_name = "test-bridge";
    return options;
}

// Publishes "greet" (echoes its name argument) and "broken" (always fails).
static void install_tools(mcp_server::ToolBridgeServer &server) {
    tool_registry::ToolTable tools;
    manifest::ToolDef greet = make_tool("greet", "Say hello", "echo Hello {name}");
    manifest::ParameterDef name_parameter;
    name_parameter.description = "Who to greet";
    name_parameter.required = true;
    greet.parameters["name"] = name_parameter;
    tools["greet"] = greet;
    tools["broken"] = make_tool("broken", "", "echo failing >&2; exit 4");
    server.set_tools(std::move(tools));
}

static json request(int id, const std::string &method, const json &params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

// Test: initialize reports protocol version, capabilities and server info.
static bool test_initialize() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));

    bool passed = response["jsonrpc"] == "2.0" && response["id"] == 1 &&
                  response["result"]["protocolVersion"] == "2024-11-05" &&
                  response["result"]["capabilities"]["tools"]["listChanged"] == false &&
                  response["result"]["serverInfo"]["name"] == "test-bridge" &&
                  response["result"]["serverInfo"]["version"] == "1.0.0";
    return check(passed, "initialize returns protocol version and server info");
}

// Test: tools/list returns every tool with its schema.
static bool test_tools_list() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(request(2, "tools/list"));
    const json &tools = response["result"]["tools"];

    bool passed = tools.is_array() && tools.size() == 2;
    if (passed) {
        // Table order is by name: broken, greet.
        const json &broken = tools[0];
        const json &greet = tools[1];
        passed = broken["name"] == "broken" && broken["description"] == "Execute broken" &&
                 greet["name"] == "greet" && greet["description"] == "Say hello" &&
                 greet["inputSchema"]["type"] == "object" &&
                 greet["inputSchema"]["properties"]["name"]["type"] == "string" &&
                 greet["inputSchema"]["required"] == json::array({"name"});
    }
    if (!passed) {
        std::cout << "  got: " << response.dump() << std::endl;
    }
    return check(passed, "tools/list lists tools with schemas and fallback descriptions");
}

// Test: a successful call returns the output as text with isError false.
static bool test_tools_call_success() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(
        request(3, "tools/call", {{"name", "greet"}, {"arguments", {{"name", "World"}}}}));

    const json &result = response["result"];
    bool passed = !response.contains("error") && result["isError"] == false &&
                  result["content"][0]["type"] == "text" && result["content"][0]["text"] == "Hello World";
    if (!passed) {
        std::cout << "  got: " << response.dump() << std::endl;
    }
    return check(passed, "tools/call returns tool output as text content");
}

// Test: a failing tool is a successful envelope with isError true.
static bool test_tools_call_failure() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(request(4, "tools/call", {{"name", "broken"}}));

    const json &result = response["result"];
    bool passed = !response.contains("error") && result["isError"] == true &&
                  result["content"][0]["text"] == "Error: failing";
    return check(passed, "Failing tool is reported with isError inside a result");
}

// Test: an unknown tool lists the available ones, still without a JSON-RPC error.
static bool test_tools_call_unknown() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(request(5, "tools/call", {{"name", "nope"}}));

    std::string text = response["result"]["content"][0]["text"].get<std::string>();
    bool passed = !response.contains("error") && response["result"]["isError"] == true &&
                  text == "Error: Unknown tool: nope. Available: broken, greet";
    if (!passed) {
        std::cout << "  got: " << text << std::endl;
    }
    return check(passed, "Unknown tool names the available tools");
}

// Test: ping answers with an empty result.
static bool test_ping() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json response = server.dispatch_message(request(6, "ping"));
    return check(response["id"] == 6 && response["result"] == json::object(), "ping returns an empty object");
}

// Test: unknown methods fail only when a reply is expected.
static bool test_unknown_method() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json with_id = server.dispatch_message(request(7, "resources/list"));
    json without_id = server.dispatch_message({{"jsonrpc", "2.0"}, {"method", "resources/list"}});

    bool passed = with_id["error"]["code"] == -32601 && with_id["id"] == 7 &&
                  with_id["error"]["message"].get<std::string>().find("resources/list") != std::string::npos &&
                  without_id.is_null();
    return check(passed, "Unknown method gets -32601, or nothing without an id");
}

// Test: notifications never produce a reply.
static bool test_notifications_are_silent() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    json initialized = server.dispatch_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    json cancelled = server.dispatch_message(
        {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", {{"requestId", 3}}}});
    return check(initialized.is_null() && cancelled.is_null(), "Notifications are acknowledged silently");
}

// Test: framing errors become error responses with a null id.
static bool test_handle_line_errors() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    std::optional<std::string> malformed = server.handle_line("{not json");
    std::optional<std::string> not_object = server.handle_line("[1,2,3]");
    std::optional<std::string> blank = server.handle_line("   ");

    bool passed = malformed && not_object && !blank;
    if (passed) {
        json malformed_reply = json::parse(*malformed);
        json not_object_reply = json::parse(*not_object);
        passed = malformed_reply["error"]["code"] == -32700 && malformed_reply["id"].is_null() &&
                 not_object_reply["error"]["code"] == -32600 && not_object_reply["id"].is_null();
    }
    return check(passed, "Malformed lines get -32700, non-objects -32600, blank lines nothing");
}

// Test: the stdio loop answers every request line in order and skips notifications.
static bool test_run_stdio_session() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);

    std::string session = request(1, "initialize").dump() + "\n" +
                          json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n" +
                          request(2, "tools/list").dump() + "\r\n" +
                          "garbage\n" +
                          request(3, "tools/call", {{"name", "greet"}, {"arguments", {{"name", "stdio"}}}}).dump() +
                          "\n";
    std::istringstream input(session);
    std::ostringstream output;
    server.run_stdio(input, output);

    std::vector<json> replies;
    std::istringstream reader(output.str());
    std::string line;
    while (std::getline(reader, line)) {
        replies.push_back(json::parse(line));
    }

    bool passed = replies.size() == 4 && replies[0]["id"] == 1 && replies[1]["id"] == 2 &&
                  replies[2]["error"]["code"] == -32700 && replies[3]["id"] == 3 &&
                  replies[3]["result"]["content"][0]["text"] == "Hello stdio";
    if (!passed) {
        std::cout << "  got: " << output.str() << std::endl;
    }
    return check(passed, "stdio session replies one line per request in order");
}

// Test: a snapshot taken before a reload keeps the old table.
static bool test_reload_snapshot() {
    mcp_server::ToolBridgeServer server(test_options());
    install_tools(server);
    std::shared_ptr<const tool_registry::ToolTable> before = server.tools();

    tool_registry::ToolTable replacement;
    replacement["only"] = make_tool("only", "Only tool", "echo only");
    server.set_tools(std::move(replacement));

    std::shared_ptr<const tool_registry::ToolTable> after = server.tools();
    bool passed = before->size() == 2 && before->count("greet") == 1 &&
                  after->size() == 1 && after->count("only") == 1;
    return check(passed, "Reload swaps the table without touching earlier snapshots");
}

// Test: load_tools reads the configured directory.
static bool test_load_tools_from_directory() {
    test_support::TempDirectory directory("server_load");
    directory.write("tools.json", R"({"version": "1.0", "default_runtime": "cli",
        "tools": [{"name": "hi", "command": "echo hi"}, {"name": "bye", "command": "echo bye"}]})");
    directory.write("broken.json", "{");

    mcp_server::ServerOptions options;
    options.manifest_directory = directory.path().string();
    mcp_server::ToolBridgeServer server(options);

    size_t count = server.load_tools();
    return check(count == 2 && server.tools()->count("hi") == 1 && server.tools()->count("bye") == 1,
                 "load_tools registers tools from the manifest directory");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_tools_list();
    all_passed &= test_tools_call_success();
    all_passed &= test_tools_call_failure();
    all_passed &= test_tools_call_unknown();
    all_passed &= test_ping();
    all_passed &= test_unknown_method();
    all_passed &= test_notifications_are_silent();
    all_passed &= test_handle_line_errors();
    all_passed &= test_run_stdio_session();
    all_passed &= test_reload_snapshot();
    all_passed &= test_load_tools_from_directory();
    return all_passed;
}

} // namespace test_mcp_server
