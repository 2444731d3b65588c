#include "config/server_config.hpp"
#include "platform/platform_abi.hpp"

#include <cstdlib>

namespace server_config {

std::optional<std::string> process_environment(const std::string &variable) {
    const char *value = std::getenv(variable.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

ParseResult parse_command_line(const std::vector<std::string> &arguments) {
    ParseResult result;

    if (arguments.empty()) {
        result.command_line.show_help = true;
        result.success = true;
        return result;
    }

    const std::string &command = arguments[0];
    if (command == "--help" || command == "-h") {
        result.command_line.show_help = true;
        result.success = true;
        return result;
    }
    if (command != "serve") {
        result.error_message = "Unknown command: " + command;
        return result;
    }
    result.command_line.command = command;

    for (size_t index = 1; index < arguments.size(); ++index) {
        const std::string &option = arguments[index];
        if (option == "--help" || option == "-h") {
            result.command_line.show_help = true;
            continue;
        }

        std::optional<std::string> *target = nullptr;
        if (option == "--db") {
            target = &result.command_line.database_path;
        } else if (option == "--name") {
            target = &result.command_line.name;
        } else if (option == "--watermark") {
            target = &result.command_line.watermark;
        } else if (option == "--config") {
            target = &result.command_line.config_file;
        } else if (option == "--key") {
            target = &result.command_line.key;
        } else {
            result.error_message = "Unknown option: " + option;
            return result;
        }

        if (index + 1 >= arguments.size()) {
            result.error_message = "Missing value for " + option;
            return result;
        }
        *target = arguments[++index];
    }

    result.success = true;
    return result;
}

static bool read_string(const json &object, const char *key, std::string &output, std::string &error_message) {
    if (!object.contains(key)) {
        return true;
    }
    if (!object[key].is_string()) {
        error_message = std::string("'") + key + "' must be a string";
        return false;
    }
    output = object[key].get<std::string>();
    return true;
}

bool apply_config_json(const json &document, ServerConfig &config, std::string &error_message) {
    if (!document.is_object()) {
        error_message = "config must be a JSON object";
        return false;
    }

    if (!read_string(document, "name", config.name, error_message) ||
        !read_string(document, "description", config.description, error_message) ||
        !read_string(document, "watermark", config.watermark, error_message)) {
        return false;
    }

    if (document.contains("database")) {
        const json &database = document["database"];
        if (!database.is_object()) {
            error_message = "'database' must be an object";
            return false;
        }
        if (database.contains("type") && database["type"] != "sqlite") {
            error_message = "only the 'sqlite' database type is supported";
            return false;
        }
        if (!read_string(database, "path", config.database_path, error_message)) {
            return false;
        }
    }

    if (document.contains("auth")) {
        const json &auth = document["auth"];
        if (!auth.is_object()) {
            error_message = "'auth' must be an object";
            return false;
        }
        if (auth.contains("enabled")) {
            if (!auth["enabled"].is_boolean()) {
                error_message = "'auth.enabled' must be a boolean";
                return false;
            }
            config.auth.enabled = auth["enabled"].get<bool>();
        }
        if (auth.contains("ownerKey")) {
            if (!auth["ownerKey"].is_string()) {
                error_message = "'auth.ownerKey' must be a string";
                return false;
            }
            config.auth.owner_key = auth["ownerKey"].get<std::string>();
        }
    }

    return true;
}

void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup) {
    std::optional<std::string> database_path = lookup("INKWELL_DB");
    if (database_path && !database_path->empty()) {
        config.database_path = *database_path;
    }

    std::optional<std::string> owner_key = lookup("INKWELL_OWNER_KEY");
    if (owner_key && !owner_key->empty()) {
        config.auth.enabled = true;
        config.auth.owner_key = *owner_key;
    }

    std::optional<std::string> presented_key = lookup("INKWELL_KEY");
    if (presented_key && !presented_key->empty()) {
        config.presented_key = *presented_key;
    }
}

LoadResult load_config(const CommandLine &command_line, const EnvironmentLookup &lookup) {
    LoadResult result;

    if (command_line.config_file) {
        std::string contents;
        if (!platform::read_file_contents(*command_line.config_file, contents)) {
            result.error_message = "Cannot read config file: " + *command_line.config_file;
            return result;
        }
        json document = json::parse(contents, nullptr, false);
        if (document.is_discarded()) {
            result.error_message = "Config file is not valid JSON: " + *command_line.config_file;
            return result;
        }
        std::string error_message;
        if (!apply_config_json(document, result.config, error_message)) {
            result.error_message = "Invalid config file " + *command_line.config_file + ": " + error_message;
            return result;
        }
    }

    apply_environment(result.config, lookup);

    if (command_line.database_path) {
        result.config.database_path = *command_line.database_path;
    }
    if (command_line.name) {
        result.config.name = *command_line.name;
    }
    if (command_line.watermark) {
        result.config.watermark = *command_line.watermark;
    }
    if (command_line.key) {
        result.config.presented_key = *command_line.key;
    }

    if (result.config.database_path.empty()) {
        result.error_message = "Database path must not be empty";
        return result;
    }

    result.success = true;
    return result;
}

std::string usage_text() {
    return
        "inkwell - MCP server for newsletter creators\n"
        "\n"
        "Commands:\n"
        "  serve     Start the MCP server (stdio transport)\n"
        "\n"
        "Options:\n"
        "  --db <path>         SQLite database path (default: ./data/inkwell.db)\n"
        "  --name <name>       Server name\n"
        "  --watermark <text>  Watermark text\n"
        "  --config <file>     JSON config file\n"
        "  --key <key>         Owner key presented by this session\n"
        "\n"
        "Environment:\n"
        "  INKWELL_DB          Database path\n"
        "  INKWELL_OWNER_KEY   Enables auth with this owner key\n"
        "  INKWELL_KEY         Owner key presented by this session\n"
        "  INKWELL_DEBUG       1/true/yes for debug logging on stderr\n"
        "\n"
        "Examples:\n"
        "  inkwell serve\n"
        "  inkwell serve --db ./my-newsletter.db\n";
}

} // namespace server_config
