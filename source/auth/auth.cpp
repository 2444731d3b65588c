#include "auth/auth.hpp"

namespace auth {

AuthContext resolve_auth(bool auth_enabled,
                         const std::optional<std::string> &configured_key,
                         const std::optional<std::string> &presented_key) {
    if (!auth_enabled) {
        return AuthContext{Role::Owner};
    }
    if (!configured_key.has_value() || !presented_key.has_value() ||
        configured_key->empty() || presented_key->empty()) {
        return AuthContext{Role::Public};
    }
    if (*presented_key == *configured_key) {
        return AuthContext{Role::Owner};
    }
    return AuthContext{Role::Public};
}

bool is_owner(const AuthContext *context) {
    return context != nullptr && context->role == Role::Owner;
}

const char *role_name(Role role) {
    return role == Role::Owner ? "owner" : "public";
}

} // namespace auth
