#include "mcp/mcp_tools.hpp"

#include <stdexcept>

namespace mcp_tools {

void ToolRegistry::register_tool(ToolDefinition definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!definition.handler) {
        throw std::invalid_argument("tool '" + definition.name + "' has no handler");
    }
    if (index_by_name_.count(definition.name) > 0) {
        throw std::invalid_argument("tool '" + definition.name + "' is already registered");
    }

    index_by_name_[definition.name] = tools_.size();
    tools_.push_back(std::move(definition));
}

const ToolDefinition *ToolRegistry::find(const std::string &tool_name) const {
    auto found = index_by_name_.find(tool_name);
    if (found == index_by_name_.end()) {
        return nullptr;
    }
    return &tools_[found->second];
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
