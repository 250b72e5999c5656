#pragma once
#include "../tool.hpp"
#include <utility>

namespace fsgate {

// Writes a fixed template file, relative to the current directory unless
// an absolute filename is given. Used by clients as a smoke test.
class CreateSampleFileTool : public Tool {
public:
    static constexpr const char* kDefaultFilename = "sample.txt";

    CreateSampleFileTool(const PathValidator& validator, std::string server_name)
        : validator_(validator), server_name_(std::move(server_name)) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "create_sample_file"; }
    std::string description() const override;
    std::string parameters_json() const override;

    std::string render_template() const;

private:
    const PathValidator& validator_;
    std::string server_name_;
};

} // namespace fsgate
