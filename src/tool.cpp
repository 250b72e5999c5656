#include "tool.hpp"
#include "config.hpp"
#include "tools/read_file.hpp"
#include "tools/write_file.hpp"
#include "tools/list_directory.hpp"
#include "tools/get_system_info.hpp"
#include "tools/create_sample_file.hpp"
#include "tools/get_allowed_paths.hpp"

namespace fsgate {

const char* tool_error_name(ToolError error) {
    switch (error) {
        case ToolError::None:             return "none";
        case ToolError::PolicyDenied:     return "policy_denied";
        case ToolError::MalformedInput:   return "malformed_input";
        case ToolError::IOFailure:        return "io_failure";
        case ToolError::UnknownOperation: return "unknown_operation";
    }
    return "unknown";
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(const PathValidator& validator,
                                                        const Config& config) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<ReadFileTool>(validator, config.tools.max_read_bytes));
    tools.push_back(std::make_unique<WriteFileTool>(validator));
    tools.push_back(std::make_unique<ListDirectoryTool>(validator));
    tools.push_back(std::make_unique<SystemInfoTool>());
    tools.push_back(std::make_unique<CreateSampleFileTool>(validator, config.server.name));
    tools.push_back(std::make_unique<AllowedPathsTool>(validator));
    return tools;
}

} // namespace fsgate
