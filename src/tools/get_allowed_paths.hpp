#pragma once
#include "../tool.hpp"

namespace fsgate {

class AllowedPathsTool : public Tool {
public:
    explicit AllowedPathsTool(const PathValidator& validator) : validator_(validator) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_allowed_paths"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathValidator& validator_;
};

} // namespace fsgate
