// Tests for command-line parsing and layered configuration loading.

#include "config/server_config.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <unistd.h>

using json = nlohmann::json;
using test_support::check;

namespace test_config {

// An environment backed by a map instead of the process environment.
static server_config::EnvironmentLookup fake_environment(const std::map<std::string, std::string> &values) {
    return [values](const std::string &variable) -> std::optional<std::string> {
        auto found = values.find(variable);
        if (found == values.end()) {
            return std::nullopt;
        }
        return found->second;
    };
}

// Test: No arguments and --help both ask for usage.
static bool test_help_requests() {
    server_config::ParseResult empty = server_config::parse_command_line({});
    server_config::ParseResult help = server_config::parse_command_line({"--help"});
    server_config::ParseResult serve_help = server_config::parse_command_line({"serve", "--help"});
    return check(empty.success && empty.command_line.show_help && help.success && help.command_line.show_help &&
                     serve_help.success && serve_help.command_line.show_help,
                 "Empty arguments and --help request usage");
}

// Test: serve accepts every documented option.
static bool test_serve_options() {
    server_config::ParseResult parsed = server_config::parse_command_line(
        {"serve", "--db", "/tmp/news.db", "--name", "Signal", "--watermark", "From Signal", "--key", "k1"});
    const server_config::CommandLine &line = parsed.command_line;
    bool success = parsed.success && line.command == "serve" && !line.show_help &&
                   line.database_path == std::string("/tmp/news.db") && line.name == std::string("Signal") &&
                   line.watermark == std::string("From Signal") && line.key == std::string("k1") &&
                   !line.config_file.has_value();

    if (success) {
        std::cout << "  OK: serve options parsed" << std::endl;
    } else {
        std::cout << "  FAIL: serve options: " << parsed.error_message << std::endl;
    }
    return success;
}

// Test: Unknown commands and options, and options missing their value, are errors.
static bool test_parse_errors() {
    server_config::ParseResult unknown_command = server_config::parse_command_line({"import"});
    server_config::ParseResult unknown_option = server_config::parse_command_line({"serve", "--port", "80"});
    server_config::ParseResult missing_value = server_config::parse_command_line({"serve", "--db"});
    return check(!unknown_command.success && !unknown_option.success && !missing_value.success &&
                     missing_value.error_message == "Missing value for --db",
                 "Unknown command, unknown option and missing value are rejected");
}

// Test: Defaults apply when nothing is configured.
static bool test_defaults() {
    server_config::LoadResult loaded = server_config::load_config({}, fake_environment({}));
    const server_config::ServerConfig &config = loaded.config;
    return check(loaded.success && config.name == "Inkwell Newsletter" && config.watermark == "Source: Inkwell MCP" &&
                     config.database_path == "./data/inkwell.db" && !config.auth.enabled &&
                     !config.presented_key.has_value(),
                 "Defaults apply with an empty environment");
}

// Test: Environment overrides defaults; the command line overrides the environment.
static bool test_precedence() {
    auto environment = fake_environment({{"INKWELL_DB", "/env/news.db"},
                                         {"INKWELL_OWNER_KEY", "owner-secret"},
                                         {"INKWELL_KEY", "from-env"}});

    server_config::LoadResult from_environment = server_config::load_config({}, environment);

    server_config::CommandLine line;
    line.command = "serve";
    line.database_path = "/cli/news.db";
    line.key = "from-cli";
    server_config::LoadResult from_command_line = server_config::load_config(line, environment);

    bool success = from_environment.success && from_environment.config.database_path == "/env/news.db" &&
                   from_environment.config.auth.enabled &&
                   from_environment.config.auth.owner_key == std::string("owner-secret") &&
                   from_environment.config.presented_key == std::string("from-env") &&
                   from_command_line.success && from_command_line.config.database_path == "/cli/news.db" &&
                   from_command_line.config.presented_key == std::string("from-cli");
    return check(success, "Command line beats environment beats defaults");
}

// Test: JSON config keys are applied; wrong types are reported.
static bool test_config_json() {
    server_config::ServerConfig config;
    std::string error_message;
    json document = {
        {"name", "The Ledger"},
        {"database", {{"type", "sqlite"}, {"path", "ledger.db"}}},
        {"auth", {{"enabled", true}, {"ownerKey", "k"}}}
    };
    bool applied = server_config::apply_config_json(document, config, error_message);

    server_config::ServerConfig untouched;
    std::string type_error;
    bool rejected = !server_config::apply_config_json(json{{"auth", {{"enabled", "yes"}}}}, untouched, type_error);

    return check(applied && config.name == "The Ledger" && config.database_path == "ledger.db" &&
                     config.auth.enabled && config.auth.owner_key == std::string("k") &&
                     config.description == "Editorial intelligence MCP server" && rejected &&
                     type_error == "'auth.enabled' must be a boolean",
                 "JSON config applies known keys and rejects wrong types");
}

// Test: A config file is read through --config; an unreadable one is a startup error.
static bool test_config_file() {
    std::string path = "/tmp/inkwell_test_config_" + std::to_string(getpid()) + ".json";
    {
        std::ofstream file(path);
        file << "{\"watermark\": \"From the file\", \"database\": {\"path\": \"file.db\"}}";
    }

    server_config::CommandLine line;
    line.command = "serve";
    line.config_file = path;
    server_config::LoadResult loaded = server_config::load_config(line, fake_environment({}));
    std::remove(path.c_str());

    server_config::CommandLine missing;
    missing.config_file = path;
    server_config::LoadResult failed = server_config::load_config(missing, fake_environment({}));

    return check(loaded.success && loaded.config.watermark == "From the file" &&
                     loaded.config.database_path == "file.db" && !failed.success,
                 "Config file is applied; a missing file fails");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_help_requests();
    all_passed &= test_serve_options();
    all_passed &= test_parse_errors();
    all_passed &= test_defaults();
    all_passed &= test_precedence();
    all_passed &= test_config_json();
    all_passed &= test_config_file();
    return all_passed;
}

} // namespace test_config
