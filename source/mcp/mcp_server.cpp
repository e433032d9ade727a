#include "mcp/mcp_server.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace mcp_server {

namespace {

constexpr std::chrono::milliseconds kStopPollInterval(200);

} // namespace

ToolBridgeServer::ToolBridgeServer(ServerOptions options)
    : options_(std::move(options)), tools_(std::make_shared<const tool_registry::ToolTable>()) {}

size_t ToolBridgeServer::load_tools() {
    mcp_stdio::log_message("Loading manifests from " + options_.manifest_directory);
    tool_registry::LoadResult loaded = tool_registry::load_all(options_.manifest_directory);

    for (const auto &file : loaded.loaded_files) {
        mcp_stdio::log_message("  Loaded " + std::to_string(file.tool_count) + " tools from " + file.file_name);
    }
    for (const auto &warning : loaded.warnings) {
        mcp_stdio::log_message("  WARNING: Failed to load " + warning.file_name + ": " + warning.message);
    }

    size_t tool_count = loaded.tools.size();
    set_tools(std::move(loaded.tools));
    mcp_stdio::log_message("Total tools registered: " + std::to_string(tool_count));
    return tool_count;
}

void ToolBridgeServer::set_tools(tool_registry::ToolTable tools) {
    auto table = std::make_shared<const tool_registry::ToolTable>(std::move(tools));
    std::lock_guard<std::mutex> lock(tools_mutex_);
    tools_ = std::move(table);
}

std::shared_ptr<const tool_registry::ToolTable> ToolBridgeServer::tools() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_;
}

tool_executor::ExecutionResult ToolBridgeServer::call_tool(const std::string &name, const json &arguments) {
    std::shared_ptr<const tool_registry::ToolTable> table = tools();

    auto found = table->find(name);
    if (found == table->end()) {
        tool_executor::ExecutionResult result;
        result.error_kind = tool_executor::ExecutionErrorKind::UnknownTool;
        result.error_message = "Unknown tool: " + name + ". Available: " +
                               text_utils::join(tool_registry::tool_names(*table), ", ");
        return result;
    }

    const manifest::ToolDef &tool = found->second;
    mcp_stdio::log_message("Executing " + name + " (runtime=" + manifest::runtime_to_string(tool.runtime) + ")");
    tool_executor::ExecutionResult result = executor_.execute(tool, arguments);
    if (result.success) {
        mcp_stdio::log_message("Completed " + name + " (" + std::to_string(result.output.size()) + " chars)");
    } else {
        mcp_stdio::log_message("Failed " + name + " (" + tool_executor::error_kind_to_string(result.error_kind) +
                               "): " + result.error_message);
    }
    return result;
}

json ToolBridgeServer::handle_initialize(const json &request_id, const json &params) const {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"]["listChanged"] = false;

    json server_info;
    server_info["name"] = options_.server_name;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json ToolBridgeServer::handle_tools_list(const json &request_id, const json &params) const {
    (void)params;
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response(*tools()));
}

// Tool failures of any kind travel inside a successful envelope with isError set.
json ToolBridgeServer::handle_tools_call(const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    json payload;
    try {
        tool_executor::ExecutionResult result = call_tool(tool_name, arguments);
        if (result.success) {
            payload = mcp_tools::build_text_result(result.output, false);
        } else {
            payload = mcp_tools::build_text_result("Error: " + result.error_message, true);
        }
    } catch (const std::exception &error) {
        mcp_stdio::log_message("Unexpected error in " + tool_name + ": " + error.what());
        payload = mcp_tools::build_text_result("Unexpected error: " + std::string(error.what()), true);
    }
    return json_rpc::build_response(request_id, payload);
}

json ToolBridgeServer::handle_ping(const json &request_id, const json &params) const {
    (void)params;
    return json_rpc::build_response(request_id, json::object());
}

json ToolBridgeServer::dispatch_message(const json &message) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);
    bool is_request = json_rpc::has_request_id(message);

    // Notifications (e.g. notifications/initialized) are acknowledged silently.
    if (!is_request && json_rpc::is_notification_method(method)) {
        return nullptr;
    }

    debug_log::log("dispatch " + method);

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "ping") {
        return handle_ping(request_id, params);
    }

    if (!is_request) {
        return nullptr;
    }
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Method not found: " + method);
}

std::optional<std::string> ToolBridgeServer::handle_line(const std::string &line) {
    std::string trimmed = text_utils::trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    json message;
    try {
        message = json::parse(trimmed);
    } catch (const json::parse_error &error) {
        mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
        return json_rpc::serialize(json_rpc::build_error_response(
            nullptr, json_rpc::PARSE_ERROR, "Parse error: " + std::string(error.what())));
    }

    if (!message.is_object()) {
        return json_rpc::serialize(json_rpc::build_error_response(
            nullptr, json_rpc::INVALID_REQUEST, "Invalid Request: expected a JSON object"));
    }

    json response = dispatch_message(message);
    if (response.is_null()) {
        return std::nullopt;
    }
    return json_rpc::serialize(response);
}

void ToolBridgeServer::run_stdio(std::istream &input, std::ostream &output,
                                 const std::function<bool()> &should_stop) {
    mcp_stdio::log_message(options_.server_name + " MCP Server v" + SERVER_VERSION + " - " +
                           std::to_string(tools()->size()) + " tools loaded");
    mcp_stdio::log_message("Listening on stdio...");

    mcp_stdio::LineChannel channel(input);
    std::string line;

    while (true) {
        if (should_stop && should_stop()) {
            mcp_stdio::log_message("Shutdown requested.");
            break;
        }

        mcp_stdio::LineChannel::PopStatus status = channel.pop(line, kStopPollInterval);
        if (status == mcp_stdio::LineChannel::PopStatus::Closed) {
            debug_log::log("EOF on stdin.");
            break;
        }
        if (status == mcp_stdio::LineChannel::PopStatus::Timeout) {
            continue;
        }

        // A single bad request must never take the session down.
        try {
            std::optional<std::string> reply = handle_line(line);
            if (reply) {
                mcp_stdio::write_message(output, *reply);
            }
        } catch (const std::exception &error) {
            mcp_stdio::log_message("Unexpected error: " + std::string(error.what()));
        }
    }
}

} // namespace mcp_server
