#pragma once
#include "../tool.hpp"
#include <cstdint>

namespace fsgate {

class ReadFileTool : public Tool {
public:
    ReadFileTool(const PathValidator& validator, uint64_t max_bytes);

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "read_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathValidator& validator_;
    uint64_t max_bytes_;
};

} // namespace fsgate
