#ifndef TBMCPS_MCP_SERVER_HPP
#define TBMCPS_MCP_SERVER_HPP

// The bridge server: owns the tool table and the execution engine and answers
// MCP JSON-RPC messages against them.

#include "executor/tool_executor.hpp"
#include "manifest/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace mcp_server {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char PROTOCOL_VERSION[] = "2024-11-05";
constexpr const char SERVER_VERSION[] = "1.0.0";

struct ServerOptions {
    std::string manifest_directory = "manifests";
    std::string server_name = "tbmcps";
};

class ToolBridgeServer {
public:
    explicit ToolBridgeServer(ServerOptions options);

    // Load every manifest in the configured directory and publish the result
    // as the new tool table in one step. Safe to call again to reload.
    // Returns the number of tools registered.
    size_t load_tools();

    // Publish a prepared table (embedding and tests).
    void set_tools(tool_registry::ToolTable tools);

    // Snapshot of the current table; unaffected by later reloads.
    std::shared_ptr<const tool_registry::ToolTable> tools() const;

    // Execute a tool by name. Unknown names fail with UnknownTool and a
    // message listing the available tools.
    tool_executor::ExecutionResult call_tool(const std::string &name, const json &arguments);

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a
    // null json value when no reply must be sent.
    json dispatch_message(const json &message);

    // Handle one raw input line: framing errors become JSON-RPC error
    // responses. Returns the serialized reply, or nothing.
    std::optional<std::string> handle_line(const std::string &line);

    // Serve newline-delimited JSON-RPC until EOF on input, or until
    // should_stop returns true (checked between requests).
    void run_stdio(std::istream &input, std::ostream &output,
                   const std::function<bool()> &should_stop = nullptr);

private:
    json handle_initialize(const json &request_id, const json &params) const;
    json handle_tools_list(const json &request_id, const json &params) const;
    json handle_tools_call(const json &request_id, const json &params);
    json handle_ping(const json &request_id, const json &params) const;

    ServerOptions options_;
    tool_executor::ToolExecutor executor_;

    mutable std::mutex tools_mutex_;
    std::shared_ptr<const tool_registry::ToolTable> tools_;
};

} // namespace mcp_server

#endif // TBMCPS_MCP_SERVER_HPP
