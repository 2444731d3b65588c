#ifndef INKWELL_MCP_DISPATCH_HPP
#define INKWELL_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler. Holds no state
// between calls beyond the registry, the environment and the session's auth.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "auth/auth.hpp"
#include "mcp/mcp_errors.hpp"
#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
extern const char *const PROTOCOL_VERSION;
extern const char *const SERVER_VERSION;

class Dispatcher {
public:
    // auth_context is std::nullopt for a caller with no session.
    Dispatcher(const mcp_tools::ToolRegistry &registry,
               mcp_tools::ToolEnvironment &environment,
               std::optional<auth::AuthContext> auth_context);

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a null
    // json value for notifications: they run, but their response is dropped.
    json dispatch_message(const json &message);

private:
    json route(const json &request_id, const std::string &method, const json &params);
    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id, const json &params);
    json handle_tools_call(const json &request_id, const json &params);

    const mcp_tools::ToolRegistry &registry_;
    mcp_tools::ToolEnvironment &environment_;
    std::optional<auth::AuthContext> auth_context_;
};

// Builds the error envelope for any DispatchError alternative.
json build_error_response(const json &request_id, const mcp_errors::DispatchError &error);

} // namespace mcp_dispatch

#endif // INKWELL_MCP_DISPATCH_HPP
