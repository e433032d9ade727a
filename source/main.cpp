// TBMCPS – Tool Bridge Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Loads tool manifests from a directory and serves them over JSON-RPC 2.0,
// one message per line on stdin/stdout. Logs go to stderr; stdout carries protocol only.

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "mcp/mcp_server.hpp"
#include "mcp/mcp_stdio.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

static void print_usage() {
    std::cerr << "Usage: tbmcps [--manifests|-m <dir>] [--name <server-name>] [--verbose|-v]\n"
              << "\n"
              << "  --manifests, -m  Directory containing manifest JSON files\n"
              << "                   (default: $TBMCPS_MANIFEST_DIR or manifests)\n"
              << "  --name           Server name reported to MCP clients\n"
              << "                   (default: $TBMCPS_SERVER_NAME or tbmcps)\n"
              << "  --verbose, -v    Enable debug logging (same as TBMCPS_DEBUG=1)\n";
}

static std::string environment_or(const char *name, const std::string &fallback) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return fallback;
    }
    return value;
}

int main(int argc, char **argv) {
    mcp_server::ServerOptions options;
    options.manifest_directory = environment_or("TBMCPS_MANIFEST_DIR", options.manifest_directory);
    options.server_name = environment_or("TBMCPS_SERVER_NAME", options.server_name);

    for (int index = 1; index < argc; index++) {
        std::string argument = argv[index];
        if (argument == "--help" || argument == "-h") {
            print_usage();
            return 0;
        }
        if (argument == "--verbose" || argument == "-v") {
            debug_log::set_debug_enabled(true);
            continue;
        }
        if ((argument == "--manifests" || argument == "-m" || argument == "--name") && index + 1 < argc) {
            std::string value = argv[++index];
            if (argument == "--name") {
                options.server_name = value;
            } else {
                options.manifest_directory = value;
            }
            continue;
        }
        std::cerr << "[tbmcps] Unknown or incomplete option: " << argument << std::endl;
        print_usage();
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::error_code directory_error;
    if (!std::filesystem::is_directory(options.manifest_directory, directory_error)) {
        mcp_stdio::log_message("Manifest directory not found: " + options.manifest_directory);
        mcp_stdio::log_message("Generate or write tool manifests there first.");
        return 1;
    }

    mcp_server::ToolBridgeServer server(options);
    if (server.load_tools() == 0) {
        mcp_stdio::log_message("No tools loaded. Add manifest files to " + options.manifest_directory + ".");
        return 1;
    }

    server.run_stdio(std::cin, std::cout, []() { return shutdown_requested != 0; });

    mcp_stdio::log_message("TBMCPS Server shut down.");
    return 0;
}
