#pragma once
#include "../tool.hpp"
#include "../path_validator.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <system_error>

namespace fsgate {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what(),
                          ToolError::MalformedInput};
    }
    if (out.is_null()) out = nlohmann::json::object();
    if (!out.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object", ToolError::MalformedInput};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field,
                          ToolError::MalformedInput};
    }
    return std::nullopt;
}

// Run `raw` through the sandbox. On success `resolved` holds the path all
// further I/O must use; the raw input must not be touched again.
inline std::optional<ToolResult> check_sandbox_path(const PathValidator& validator,
                                                    const std::string& raw,
                                                    bool check_extension,
                                                    std::string& resolved) {
    ValidationResult v = validator.validate_path(raw);
    if (v.verdict == Verdict::Invalid) {
        std::cerr << "[sandbox] Invalid path: " << v.message() << "\n";
        return ToolResult{false, "Invalid path: " + v.message(), ToolError::MalformedInput};
    }
    if (!v.allowed()) {
        std::cerr << "[sandbox] Denied " << raw << ": " << v.message() << "\n";
        std::string msg = "Access denied: " + v.message();
        if (v.reason == kReasonOutsideRoots) {
            msg += " (accessible paths: " + join(validator.allowed_roots(), ", ") + ")";
        }
        return ToolResult{false, msg, ToolError::PolicyDenied};
    }

    if (check_extension) {
        ValidationResult ext = validator.validate_extension(v.path);
        if (!ext.allowed()) {
            std::cerr << "[sandbox] Denied " << v.path << ": " << ext.message() << "\n";
            std::vector<std::string> permitted;
            for (const auto& e : validator.policy().allowed_extensions()) {
                permitted.push_back("." + e);
            }
            return ToolResult{false, "Access denied: " + ext.message() +
                                     " (permitted: " + join(permitted, ", ") + ")",
                              ToolError::PolicyDenied};
        }
    }

    resolved = v.path;
    return std::nullopt;
}

// Map a filesystem error onto an IOFailure result
inline ToolResult io_failure(const std::string& what, const std::string& path,
                             const std::error_code& ec) {
    return ToolResult{false, what + " \"" + path + "\": " + ec.message(), ToolError::IOFailure};
}

} // namespace fsgate
