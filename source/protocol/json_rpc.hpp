#ifndef TBMCPS_JSON_RPC_HPP
#define TBMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;

// Methods with this prefix are notifications and never get a reply.
constexpr const char NOTIFICATION_PREFIX[] = "notifications/";

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing.
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// True when the message carries a non-null id (a request expecting a reply).
bool has_request_id(const json &message);

// True for "notifications/..." method names.
bool is_notification_method(const std::string &method);

// Single-line serialization. Invalid UTF-8 is replaced rather than thrown on.
std::string serialize(const json &message);

} // namespace json_rpc

#endif // TBMCPS_JSON_RPC_HPP
