#pragma once
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

class PathValidator;
struct Config;

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

enum class ToolError {
    None,
    PolicyDenied,     // outside allow-list, inside deny-list, bad extension
    MalformedInput,   // missing/mistyped arguments, unresolvable path
    IOFailure,        // filesystem errors, surfaced verbatim
    UnknownOperation,
};

struct ToolResult {
    bool success;
    std::string output;
    ToolError error = ToolError::None;
    std::optional<nlohmann::json> data; // structured payload, if any
};

const char* tool_error_name(ToolError error);

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create all built-in tools. Path-bearing tools keep a reference to
// `validator`, which must outlive them.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(const PathValidator& validator,
                                                        const Config& config);

} // namespace fsgate
