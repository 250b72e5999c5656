#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>

namespace fsgate {

class PathValidator;
struct Config;

// Execute a single tool call, finding the tool by name
ToolResult dispatch_tool(const std::string& name, const std::string& args_json,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// Format a tool result as the MCP tools/call result object:
// {"content":[{"type":"text","text":...}],"isError":...[,"structuredContent":...]}
nlohmann::json format_tool_result(const ToolResult& result);

// Routes named operations to tools. Never throws from dispatch(): every
// failure comes back as an error-flagged ToolResult.
class ToolDispatcher {
public:
    ToolDispatcher(const PathValidator& validator, const Config& config);
    explicit ToolDispatcher(std::vector<std::unique_ptr<Tool>> tools);

    ToolResult dispatch(const std::string& name, const nlohmann::json& arguments) const;

    std::vector<ToolSpec> specs() const;
    std::vector<std::string> tool_names() const;

private:
    std::vector<std::unique_ptr<Tool>> tools_;
};

} // namespace fsgate
