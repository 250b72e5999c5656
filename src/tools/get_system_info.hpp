#pragma once
#include "../tool.hpp"

namespace fsgate {

class SystemInfoTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_system_info"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace fsgate
