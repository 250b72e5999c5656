#include "config.hpp"
#include "dispatcher.hpp"
#include "mcp_server.hpp"
#include "path_validator.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <vector>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cerr << "Usage: fsgate [options]\n"
              << "\n"
              << "Serves sandboxed filesystem tools over MCP (JSON-RPC on stdio).\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH       Config file (default: ~/.fsgate/config.json)\n"
              << "  -r, --root DIR          Allowed root; repeatable, replaces configured roots\n"
              << "  -b, --block DIR         Additional forbidden directory; repeatable\n"
              << "  --no-resolve-symlinks   Check lexical paths only\n"
              << "  -v, --version           Show version\n"
              << "  -h, --help              Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  FSGATE_ALLOWED_ROOTS       Colon-separated allowed roots\n"
              << "  FSGATE_BLOCKED_ROOTS       Colon-separated forbidden directories\n"
              << "  FSGATE_ALLOWED_EXTENSIONS  Comma-separated permitted extensions\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::vector<std::string> roots;
    std::vector<std::string> blocks;
    bool no_resolve_symlinks = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "fsgate " << fsgate::kServerVersion << "\n";
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-r") == 0 || std::strcmp(argv[i], "--root") == 0) && i + 1 < argc) {
            roots.push_back(fsgate::expand_home(argv[++i]));
        } else if ((std::strcmp(argv[i], "-b") == 0 || std::strcmp(argv[i], "--block") == 0) && i + 1 < argc) {
            blocks.push_back(fsgate::expand_home(argv[++i]));
        } else if (std::strcmp(argv[i], "--no-resolve-symlinks") == 0) {
            no_resolve_symlinks = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    std::cerr << "[fsgate] Starting MCP server...\n";
    auto config = fsgate::Config::load(config_path);

    // Command line overrides config and environment
    if (!roots.empty()) {
        config.sandbox.allowed_roots = roots;
    }
    for (const auto& b : blocks) {
        config.sandbox.blocked_roots.push_back(b);
    }
    if (no_resolve_symlinks) {
        config.sandbox.resolve_symlinks = false;
    }

    fsgate::PathValidator validator(fsgate::SandboxPolicy(
        config.sandbox.allowed_roots,
        config.sandbox.blocked_roots,
        config.sandbox.allowed_extensions,
        config.sandbox.resolve_symlinks));

    fsgate::ToolDispatcher dispatcher(validator, config);
    fsgate::McpServer server(dispatcher, config.server);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[fsgate] " << config.server.name << " " << fsgate::kServerVersion
              << " running on stdio\n"
              << "[fsgate] Tools: " << fsgate::join(dispatcher.tool_names(), ", ") << "\n"
              << "[fsgate] Allowed paths: " << fsgate::join(validator.allowed_roots(), ", ") << "\n"
              << "[fsgate] Symlink resolution: "
              << (validator.policy().resolve_symlinks() ? "on" : "off") << "\n";

    int rc = server.serve(STDIN_FILENO, std::cout, g_shutdown);
    std::cerr << "[fsgate] Stopped\n";
    return rc;
} catch (const std::exception& e) {
    std::cerr << "[fsgate] Fatal error: " << e.what() << '\n';
    return 1;
}
