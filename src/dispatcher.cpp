#include "dispatcher.hpp"
#include "config.hpp"
#include "path_validator.hpp"
#include <iostream>

namespace fsgate {

ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) {
            return tool->execute(args_json);
        }
    }
    return ToolResult{false, "Unknown tool: " + name, ToolError::UnknownOperation};
}

nlohmann::json format_tool_result(const ToolResult& result) {
    std::string text = result.success ? result.output : "Error: " + result.output;
    nlohmann::json j = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", !result.success}
    };
    if (result.data && result.data->is_object()) {
        j["structuredContent"] = *result.data;
    }
    return j;
}

ToolDispatcher::ToolDispatcher(const PathValidator& validator, const Config& config)
    : tools_(create_builtin_tools(validator, config)) {}

ToolDispatcher::ToolDispatcher(std::vector<std::unique_ptr<Tool>> tools)
    : tools_(std::move(tools)) {}

ToolResult ToolDispatcher::dispatch(const std::string& name,
                                    const nlohmann::json& arguments) const {
    ToolResult result{false, ""};
    if (!arguments.is_null() && !arguments.is_object()) {
        result = ToolResult{false, "Arguments must be a JSON object", ToolError::MalformedInput};
    } else {
        const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
        try {
            result = dispatch_tool(name, args.dump(), tools_);
        } catch (const std::exception& e) {
            result = ToolResult{false, "Tool " + name + " failed: " + e.what(),
                                ToolError::IOFailure};
        }
    }

    if (result.success) {
        std::cerr << "[tool] " << name << ": ok\n";
    } else {
        std::cerr << "[tool] " << name << ": " << tool_error_name(result.error)
                  << ": " << result.output << "\n";
    }
    return result;
}

std::vector<ToolSpec> ToolDispatcher::specs() const {
    std::vector<ToolSpec> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool->spec());
    }
    return out;
}

std::vector<std::string> ToolDispatcher::tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool->tool_name());
    }
    return names;
}

} // namespace fsgate
