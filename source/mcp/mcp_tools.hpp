#ifndef INKWELL_MCP_TOOLS_HPP
#define INKWELL_MCP_TOOLS_HPP

// MCP tool registry: registration, lookup and listing of tools.
// One registry is built at startup and handed to the dispatcher by reference.

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "auth/auth.hpp"
#include "config/server_config.hpp"
#include "mcp/mcp_errors.hpp"
#include "storage/sqlite_store.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// What a handler can reach besides its arguments.
struct ToolEnvironment {
    storage::SqliteStore &store;
    const server_config::ServerConfig &config;
};

// Result of one tool call: a JSON value, or a typed error.
class ToolOutcome {
public:
    ToolOutcome(json value) : value_(std::move(value)) {}
    ToolOutcome(mcp_errors::HandlerError error) : error_(mcp_errors::DispatchError(std::move(error))) {}
    ToolOutcome(mcp_errors::AuthError error) : error_(mcp_errors::DispatchError(std::move(error))) {}

    bool ok() const { return !error_.has_value(); }
    const json &value() const { return value_; }
    const mcp_errors::DispatchError &error() const { return *error_; }

private:
    json value_;
    std::optional<mcp_errors::DispatchError> error_;
};

// A tool handler receives the arguments object, the caller's auth context
// (nullptr when there is no session) and the environment.
// Unexpected failures may be thrown; the dispatcher reports them as internal errors.
using ToolHandler = std::function<ToolOutcome(const json &arguments,
                                              const auth::AuthContext *context,
                                              ToolEnvironment &environment)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Throws std::invalid_argument on an empty or duplicate name, or a missing handler.
    void register_tool(ToolDefinition definition);

    // nullptr when no tool has that name.
    const ToolDefinition *find(const std::string &tool_name) const;

    // {"tools": [{name, description, inputSchema}, ...]} in registration order.
    json build_tools_list_response() const;

    const std::vector<ToolDefinition> &tools() const { return tools_; }
    size_t size() const { return tools_.size(); }

private:
    std::vector<ToolDefinition> tools_;
    std::map<std::string, size_t> index_by_name_;
};

} // namespace mcp_tools

#endif // INKWELL_MCP_TOOLS_HPP
