#include "protocol/json_rpc.hpp"

namespace json_rpc {

static const char *kProtocolTag = "2.0";

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = kProtocolTag;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = kProtocolTag;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return get_id(message).is_null();
}

bool is_request_shape(const json &message) {
    return message.is_object() && message.contains("method") && message["method"].is_string();
}

} // namespace json_rpc
