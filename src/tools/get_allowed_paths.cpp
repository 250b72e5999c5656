#include "get_allowed_paths.hpp"
#include "tool_util.hpp"

namespace fsgate {

ToolResult AllowedPathsTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    auto roots = validator_.allowed_roots();
    std::string output = "Accessible paths:\n\n";
    for (const auto& root : roots) {
        output += "[dir] " + root + "\n";
    }
    output += "\nOnly these directories and their subdirectories are accessible.";

    ToolResult result{true, output};
    result.data = nlohmann::json{{"allowed_roots", roots}};
    return result;
}

std::string AllowedPathsTool::description() const {
    return "List the directories this server is allowed to access";
}

std::string AllowedPathsTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace fsgate
