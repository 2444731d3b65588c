#ifndef INKWELL_AUTH_HPP
#define INKWELL_AUTH_HPP

// Single-user authorization: the caller is either the owner or the public.

#include <optional>
#include <string>

namespace auth {

enum class Role {
    Owner,
    Public,
};

struct AuthContext {
    Role role = Role::Public;
};

// Auth disabled: everyone is owner. Enabled: owner only on an exact match of
// the presented key against the configured one; public otherwise, including
// when either key is missing.
AuthContext resolve_auth(bool auth_enabled,
                         const std::optional<std::string> &configured_key,
                         const std::optional<std::string> &presented_key);

// True only for a present context with the owner role. A null context is a
// caller with no session at all.
bool is_owner(const AuthContext *context);

const char *role_name(Role role);

} // namespace auth

#endif // INKWELL_AUTH_HPP
