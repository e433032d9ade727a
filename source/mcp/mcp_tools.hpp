#ifndef TBMCPS_MCP_TOOLS_HPP
#define TBMCPS_MCP_TOOLS_HPP

// MCP shapes for tools: tools/list entries and tools/call result payloads.

#include "manifest/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_tools {

using json = nlohmann::json;

// {name, description, inputSchema}. An empty description becomes "Execute <name>".
json build_tool_entry(const manifest::ToolDef &tool);

// Build the response payload for tools/list.
json build_tools_list_response(const tool_registry::ToolTable &tools);

// tools/call payload: one text content block plus the isError flag.
json build_text_result(const std::string &text, bool is_error);

} // namespace mcp_tools

#endif // TBMCPS_MCP_TOOLS_HPP
