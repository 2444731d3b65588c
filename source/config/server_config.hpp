#ifndef INKWELL_SERVER_CONFIG_HPP
#define INKWELL_SERVER_CONFIG_HPP

// Server configuration: built-in defaults, then an optional JSON file, then
// environment variables, then command-line options (highest precedence).

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace server_config {

using json = nlohmann::json;

struct AuthSettings {
    bool enabled = false;
    std::optional<std::string> owner_key;
};

struct ServerConfig {
    std::string name = "Inkwell Newsletter";
    std::string description = "Editorial intelligence MCP server";
    std::string watermark = "Source: Inkwell MCP";
    std::string database_path = "./data/inkwell.db";
    AuthSettings auth;
    // Credential presented by the client of this session, if any.
    std::optional<std::string> presented_key;
};

// Parsed "inkwell serve [options]" invocation.
struct CommandLine {
    std::string command;
    bool show_help = false;
    std::optional<std::string> database_path;
    std::optional<std::string> name;
    std::optional<std::string> watermark;
    std::optional<std::string> config_file;
    std::optional<std::string> key;
};

struct ParseResult {
    bool success = false;
    CommandLine command_line;
    std::string error_message;
};

struct LoadResult {
    bool success = false;
    ServerConfig config;
    std::string error_message;
};

// Returns the value of an environment variable, or std::nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads the process environment.
std::optional<std::string> process_environment(const std::string &variable);

// arguments excludes argv[0].
ParseResult parse_command_line(const std::vector<std::string> &arguments);

// Overlays the keys present in document onto config. Unknown keys are ignored.
bool apply_config_json(const json &document, ServerConfig &config, std::string &error_message);

// INKWELL_DB, INKWELL_OWNER_KEY (also enables auth), INKWELL_KEY.
void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup);

LoadResult load_config(const CommandLine &command_line,
                       const EnvironmentLookup &lookup = process_environment);

std::string usage_text();

} // namespace server_config

#endif // INKWELL_SERVER_CONFIG_HPP
