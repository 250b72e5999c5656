#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fsgate {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"name", "fsgate"},
            {"protocol_version", "2025-06-18"}
        }},
        {"sandbox", {
            {"allowed_roots", nlohmann::json::array({"~/Documents/00_AI_Area"})},
            {"blocked_roots", {
                "/etc", "/bin", "/sbin", "/usr/bin", "/usr/sbin",
                "/System", "/Windows", "/Program Files", "/Program Files (x86)",
                "~/.ssh", "~/.aws", "~/.config"
            }},
            {"allowed_extensions", {
                ".txt", ".md", ".json", ".js", ".ts", ".html", ".css",
                ".py", ".java", ".cpp", ".c", ".h", ".xml", ".yaml", ".yml",
                ".log", ".csv", ".tsv", ".sql", ".sh", ".bat", ".ps1"
            }},
            {"resolve_symlinks", true}
        }},
        {"tools", {
            {"max_read_bytes", 10 * 1024 * 1024}
        }}
    };
}

std::string Config::default_path() {
    return expand_home("~/.fsgate/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::vector<std::string> string_list(const nlohmann::json& arr, bool expand) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        if (!item.is_string()) continue;
        std::string s = item.get<std::string>();
        out.push_back(expand ? expand_home(s) : s);
    }
    return out;
}

static std::vector<std::string> env_list(const char* value, char delim, bool expand) {
    std::vector<std::string> out;
    for (const auto& part : split(value, delim)) {
        std::string s = trim(part);
        if (s.empty()) continue;
        out.push_back(expand ? expand_home(s) : s);
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("name") && s["name"].is_string())
            cfg.server.name = s["name"].get<std::string>();
        if (s.contains("protocol_version") && s["protocol_version"].is_string())
            cfg.server.protocol_version = s["protocol_version"].get<std::string>();
    }

    if (j.contains("sandbox") && j["sandbox"].is_object()) {
        auto& s = j["sandbox"];
        if (s.contains("allowed_roots"))
            cfg.sandbox.allowed_roots = string_list(s["allowed_roots"], true);
        if (s.contains("blocked_roots"))
            cfg.sandbox.blocked_roots = string_list(s["blocked_roots"], true);
        if (s.contains("allowed_extensions"))
            cfg.sandbox.allowed_extensions = string_list(s["allowed_extensions"], false);
        if (s.contains("resolve_symlinks") && s["resolve_symlinks"].is_boolean())
            cfg.sandbox.resolve_symlinks = s["resolve_symlinks"].get<bool>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        if (t.contains("max_read_bytes") && t["max_read_bytes"].is_number_integer() &&
            t["max_read_bytes"].get<int64_t>() > 0)
            cfg.tools.max_read_bytes = t["max_read_bytes"].get<uint64_t>();
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path.empty() ? default_path() : expand_home(path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override the config file
    if (const char* v = std::getenv("FSGATE_ALLOWED_ROOTS"))
        cfg.sandbox.allowed_roots = env_list(v, ':', true);
    if (const char* v = std::getenv("FSGATE_BLOCKED_ROOTS"))
        cfg.sandbox.blocked_roots = env_list(v, ':', true);
    if (const char* v = std::getenv("FSGATE_ALLOWED_EXTENSIONS"))
        cfg.sandbox.allowed_extensions = env_list(v, ',', false);

    return cfg;
}

} // namespace fsgate
