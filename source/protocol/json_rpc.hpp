#ifndef CHATBRIDGE_JSON_RPC_HPP
#define CHATBRIDGE_JSON_RPC_HPP

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
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

json build_response(const json &request_id, const json &result_payload);

// error_data is omitted from the message when null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

// Response to a message that could not be parsed (id is null).
json build_parse_error_response(const std::string &detail);

// Method name, or empty if missing or not a string.
std::string get_method(const json &message);

// The id, or a null json if missing (notification).
json get_id(const json &message);

// Params object, or an empty object if missing.
json get_params(const json &message);

bool is_notification(const json &message);

} // namespace json_rpc

#endif // CHATBRIDGE_JSON_RPC_HPP
