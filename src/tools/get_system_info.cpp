#include "get_system_info.hpp"
#include "tool_util.hpp"
#include "../host_info.hpp"

namespace fsgate {

ToolResult SystemInfoTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    nlohmann::json info = collect_host_info().to_json();
    ToolResult result{true, "System information:\n\n" + info.dump(2)};
    result.data = std::move(info);
    return result;
}

std::string SystemInfoTool::description() const {
    return "Get information about the host system";
}

std::string SystemInfoTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace fsgate
