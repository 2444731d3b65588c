#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace mcp_dispatch {

const char *const PROTOCOL_VERSION = "2024-11-05";
const char *const SERVER_VERSION = "0.1.0";

json build_error_response(const json &request_id, const mcp_errors::DispatchError &error) {
    json error_object = mcp_errors::to_error_object(error);
    json data = error_object.contains("data") ? error_object["data"] : json();
    return json_rpc::build_error_response(request_id, error_object["code"].get<int>(),
                                          error_object["message"].get<std::string>(), data);
}

static json protocol_error(const json &request_id, int code, const std::string &message) {
    return build_error_response(request_id, mcp_errors::ProtocolError{code, message});
}

Dispatcher::Dispatcher(const mcp_tools::ToolRegistry &registry,
                       mcp_tools::ToolEnvironment &environment,
                       std::optional<auth::AuthContext> auth_context)
    : registry_(registry), environment_(environment), auth_context_(auth_context) {}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = environment_.config.name;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = environment_.config.description;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
json Dispatcher::handle_tools_list(const json &request_id, const json &params) {
    (void)params;
    return json_rpc::build_response(request_id, registry_.build_tools_list_response());
}

// Handle the "tools/call" request.
json Dispatcher::handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string() ||
        params["name"].get_ref<const std::string &>().empty()) {
        return protocol_error(request_id, json_rpc::INVALID_PARAMS, "Missing tool name");
    }
    std::string tool_name = params["name"].get<std::string>();

    const mcp_tools::ToolDefinition *tool = registry_.find(tool_name);
    if (tool == nullptr) {
        return protocol_error(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown tool: " + tool_name);
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    debug_log::log("tools/call " + tool_name);
    const auth::AuthContext *context = auth_context_ ? &*auth_context_ : nullptr;

    try {
        mcp_tools::ToolOutcome outcome = tool->handler(arguments, context, environment_);
        if (!outcome.ok()) {
            return build_error_response(request_id, outcome.error());
        }

        json text_content;
        text_content["type"] = "text";
        text_content["text"] = outcome.value().dump(2, ' ', false, json::error_handler_t::replace);

        json result;
        result["content"] = json::array({text_content});
        return json_rpc::build_response(request_id, result);
    } catch (const std::exception &error) {
        debug_log::log("Tool " + tool_name + " failed: " + error.what());
        return build_error_response(request_id, mcp_errors::InternalError{std::string("Tool error: ") + error.what()});
    }
}

json Dispatcher::route(const json &request_id, const std::string &method, const json &params) {
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "notifications/initialized" || method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    return protocol_error(request_id, json_rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

json Dispatcher::dispatch_message(const json &message) {
    json request_id = json_rpc::get_id(message);
    bool notification = json_rpc::is_notification(message);

    json response;
    if (!json_rpc::is_request_shape(message)) {
        response = protocol_error(request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
    } else {
        std::string method = json_rpc::get_method(message);
        debug_log::log("Dispatching " + method + (notification ? " (notification)" : ""));
        try {
            response = route(request_id, method, json_rpc::get_params(message));
        } catch (const std::exception &error) {
            response = build_error_response(request_id,
                                            mcp_errors::InternalError{std::string("Internal error: ") + error.what()});
        }
    }

    if (notification) {
        return nullptr;
    }
    return response;
}

} // namespace mcp_dispatch
