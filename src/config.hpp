#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

constexpr const char* kServerVersion = "1.0.0";

struct ServerConfig {
    std::string name = "fsgate";
    std::string protocol_version = "2025-06-18";
};

struct SandboxConfig {
    std::vector<std::string> allowed_roots;
    std::vector<std::string> blocked_roots;
    std::vector<std::string> allowed_extensions;
    bool resolve_symlinks = true;
};

struct ToolsConfig {
    uint64_t max_read_bytes = 10 * 1024 * 1024;
};

struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    ToolsConfig tools;

    // Load from `path` (default ~/.fsgate/config.json) + env vars.
    // A missing file is created with defaults; a malformed one is ignored.
    static Config load(const std::string& path = "");

    // Parse an already-loaded JSON document (no env vars, no file I/O)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_path();
};

} // namespace fsgate
