#pragma once
#include "../tool.hpp"

namespace fsgate {

// Lists immediate entries in the order the filesystem yields them.
class ListDirectoryTool : public Tool {
public:
    explicit ListDirectoryTool(const PathValidator& validator) : validator_(validator) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "list_directory"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathValidator& validator_;
};

} // namespace fsgate
