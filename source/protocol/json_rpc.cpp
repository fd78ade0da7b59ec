#include "protocol/json_rpc.hpp"

namespace json_rpc {

namespace {

json envelope(const json &request_id) {
    json message;
    message["jsonrpc"] = "2.0";
    message["id"] = request_id;
    return message;
}

} // namespace

json build_response(const json &request_id, const json &result_payload) {
    json response = envelope(request_id);
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response = envelope(request_id);
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

json build_parse_error_response(const std::string &detail) {
    return build_error_response(nullptr, PARSE_ERROR, "Parse error", detail);
}

std::string get_method(const json &message) {
    auto iterator = message.find("method");
    if (iterator != message.end() && iterator->is_string()) {
        return iterator->get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    auto iterator = message.find("id");
    if (iterator != message.end()) {
        return *iterator;
    }
    return nullptr;
}

json get_params(const json &message) {
    auto iterator = message.find("params");
    if (iterator != message.end() && iterator->is_object()) {
        return *iterator;
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc
