#ifndef INKWELL_MCP_ERRORS_HPP
#define INKWELL_MCP_ERRORS_HPP

// Typed failures that can end a request. Each alternative maps to exactly one
// wire error; to_error_object() visits all of them, so adding an alternative
// without a mapping does not compile.

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace mcp_errors {

using json = nlohmann::json;

// Domain error codes used by the tool handlers.
constexpr int BAD_REQUEST = 400;
constexpr int FORBIDDEN = 403;
constexpr int NOT_FOUND = 404;

// Unknown method or tool, malformed request, bad params: JSON-RPC codes.
struct ProtocolError {
    int code;
    std::string message;
};

// The caller's role does not allow the operation.
struct AuthError {
    std::string message;
};

// A tool rejected the call: not found, validation, duplicate. Surfaced verbatim.
struct HandlerError {
    int code;
    std::string message;
    json data;
};

// Anything unexpected; the original message is kept for diagnostics.
struct InternalError {
    std::string message;
};

using DispatchError = std::variant<ProtocolError, AuthError, HandlerError, InternalError>;

// {"code": ..., "message": ..., "data"?: ...}
json to_error_object(const DispatchError &error);

HandlerError bad_request(const std::string &message);
HandlerError not_found(const std::string &message);
AuthError forbidden(const std::string &message = "Owner access required");

} // namespace mcp_errors

#endif // INKWELL_MCP_ERRORS_HPP
