// Inkwell – editorial intelligence MCP server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries only protocol frames.

#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

#include "auth/auth.hpp"
#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "storage/migrations.hpp"
#include "storage/sqlite_store.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested.store(true);
}

int main(int argc, char **argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);

    server_config::ParseResult parsed = server_config::parse_command_line(arguments);
    if (!parsed.success) {
        std::cerr << "inkwell: " << parsed.error_message << "\n\n" << server_config::usage_text();
        return 1;
    }
    if (parsed.command_line.show_help) {
        std::cout << server_config::usage_text();
        return 0;
    }

    server_config::LoadResult loaded = server_config::load_config(parsed.command_line);
    if (!loaded.success) {
        std::cerr << "inkwell: " << loaded.error_message << std::endl;
        return 1;
    }
    const server_config::ServerConfig &config = loaded.config;

    std::cerr << "[inkwell] " << config.name << " MCP server " << mcp_dispatch::SERVER_VERSION
              << ", build " << __DATE__ << " " << __TIME__ << std::endl;

    if (config.database_path != ":memory:") {
        std::string directory_error;
        if (!platform::ensure_parent_directory(config.database_path, directory_error)) {
            mcp_stdio::log_message("Cannot create database directory: " + directory_error);
            return 1;
        }
    }

    std::unique_ptr<storage::SqliteStore> store;
    try {
        store = std::make_unique<storage::SqliteStore>(config.database_path, migrations::schema_migrations());
        int applied = store->migrate();
        debug_log::log("Applied " + std::to_string(applied) + " migration(s) to " + config.database_path);
    } catch (const storage::StorageError &error) {
        mcp_stdio::log_message(std::string("Database setup failed: ") + error.what());
        return 1;
    }

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    auth::AuthContext auth_context =
        auth::resolve_auth(config.auth.enabled, config.auth.owner_key, config.presented_key);
    debug_log::log(std::string("Session role: ") + auth::role_name(auth_context.role));

    mcp_tools::ToolEnvironment environment{*store, config};
    mcp_dispatch::Dispatcher dispatcher(registry, environment, auth_context);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mcp_stdio::log_message("Serving " + std::to_string(registry.size()) + " tools from " +
                           config.database_path + ". Waiting for MCP messages on stdin.");

    mcp_stdio::StdioSession session(STDIN_FILENO, std::cout, [&dispatcher](const json &message) {
        return dispatcher.dispatch_message(message);
    });
    session.run(shutdown_requested);

    store->close();
    mcp_stdio::log_message(shutdown_requested.load() ? "Signal received. Inkwell shut down."
                                                     : "EOF on stdin. Inkwell shut down.");
    return 0;
}
