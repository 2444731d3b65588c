#include "mcp/mcp_errors.hpp"
#include "protocol/json_rpc.hpp"

#include <type_traits>

namespace mcp_errors {

json to_error_object(const DispatchError &error) {
    return std::visit([](const auto &alternative) -> json {
        using Alternative = std::decay_t<decltype(alternative)>;
        json object;

        if constexpr (std::is_same_v<Alternative, ProtocolError>) {
            object["code"] = alternative.code;
            object["message"] = alternative.message;
        } else if constexpr (std::is_same_v<Alternative, AuthError>) {
            object["code"] = FORBIDDEN;
            object["message"] = alternative.message;
        } else if constexpr (std::is_same_v<Alternative, HandlerError>) {
            object["code"] = alternative.code;
            object["message"] = alternative.message;
            if (!alternative.data.is_null()) {
                object["data"] = alternative.data;
            }
        } else {
            static_assert(std::is_same_v<Alternative, InternalError>, "unmapped DispatchError alternative");
            object["code"] = json_rpc::INTERNAL_ERROR;
            object["message"] = alternative.message;
        }
        return object;
    }, error);
}

HandlerError bad_request(const std::string &message) {
    return HandlerError{BAD_REQUEST, message, nullptr};
}

HandlerError not_found(const std::string &message) {
    return HandlerError{NOT_FOUND, message, nullptr};
}

AuthError forbidden(const std::string &message) {
    return AuthError{message};
}

} // namespace mcp_errors
