#include "mcp/mcp_tools.hpp"

namespace mcp_tools {

json build_tool_entry(const manifest::ToolDef &tool) {
    json tool_entry;
    tool_entry["name"] = tool.name;
    tool_entry["description"] = tool.description.empty() ? "Execute " + tool.name : tool.description;
    tool_entry["inputSchema"] = tool.input_schema();
    return tool_entry;
}

json build_tools_list_response(const tool_registry::ToolTable &tools) {
    json tools_array = json::array();
    for (const auto &entry : tools) {
        tools_array.push_back(build_tool_entry(entry.second));
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

} // namespace mcp_tools
