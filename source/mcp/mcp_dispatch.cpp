#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/server_log.hpp"

#include <algorithm>
#include <array>

namespace mcp_dispatch {

const char *const PROTOCOL_VERSION = "2024-11-05";

namespace {

const std::array<const char *, 3> kSupportedProtocolVersions = {"2024-11-05", "2025-03-26", "2025-06-18"};

// Echo the client's protocol version when we speak it, otherwise offer ours.
std::string negotiate_protocol_version(const json &params) {
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string()) {
        const std::string version = requested->get<std::string>();
        bool supported = std::any_of(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(),
                                     [&version](const char *candidate) { return version == candidate; });
        if (supported) {
            return version;
        }
    }
    return PROTOCOL_VERSION;
}

json handle_initialize(const ServerInfo &server_info, const json &request_id, const json &params) {
    json capabilities;
    capabilities["tools"] = json::object();

    json info;
    info["name"] = server_info.name;
    info["version"] = server_info.version;
    info["description"] = server_info.description;

    json result;
    result["protocolVersion"] = negotiate_protocol_version(params);
    result["capabilities"] = capabilities;
    result["serverInfo"] = info;

    return json_rpc::build_response(request_id, result);
}

json handle_tools_call(const mcp_tools::ToolRegistry &tools, const json &request_id, const json &params) {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    auto supplied = params.find("arguments");
    if (supplied != params.end() && supplied->is_object()) {
        arguments = *supplied;
    }

    const std::string tool_name = name->get<std::string>();
    server_log::debug("dispatch", "tools/call " + tool_name);
    return json_rpc::build_response(request_id, tools.dispatch_tool_call(tool_name, arguments));
}

} // namespace

bool is_long_running(const json &message) {
    return !json_rpc::is_notification(message) && json_rpc::get_method(message) == "tools/call";
}

json dispatch_message(const ServerInfo &server_info, const mcp_tools::ToolRegistry &tools, const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                              "Request must be a JSON object");
    }

    std::string method = json_rpc::get_method(message);

    // Notifications ("notifications/initialized", cancellations) need no reply.
    if (json_rpc::is_notification(message)) {
        server_log::debug("dispatch", "Notification: " + method);
        return nullptr;
    }

    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Missing 'method'");
    }
    if (method == "initialize") {
        return handle_initialize(server_info, request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return json_rpc::build_response(request_id, tools.build_tools_list_response());
    }
    if (method == "tools/call") {
        return handle_tools_call(tools, request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

} // namespace mcp_dispatch
