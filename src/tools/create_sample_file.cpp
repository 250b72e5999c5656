#include "create_sample_file.hpp"
#include "tool_util.hpp"
#include "../config.hpp"
#include "../host_info.hpp"
#include <cerrno>
#include <fstream>

namespace fsgate {

std::string CreateSampleFileTool::render_template() const {
    HostInfo host = collect_host_info();
    return "# Sample file\n"
           "\n"
           "Created: " + local_time_now() + "\n"
           "\n"
           "This file was created by the " + server_name_ + " MCP server.\n"
           "\n"
           "## Purpose\n"
           "- Model Context Protocol tool test\n"
           "- Client integration check\n"
           "- File operation check\n"
           "- Sandboxed path access\n"
           "\n"
           "## Environment\n"
           "- Server: " + server_name_ + " " + kServerVersion + "\n"
           "- Platform: " + host.platform + "\n"
           "- Architecture: " + host.arch + "\n"
           "\n"
           "## Security\n"
           "- Path access restrictions: enabled\n"
           "- Only permitted directories are accessible\n"
           "\n"
           "Happy coding!\n";
}

ToolResult CreateSampleFileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    std::string filename = kDefaultFilename;
    if (args.contains("filename") && !args["filename"].is_null()) {
        if (!args["filename"].is_string()) {
            return ToolResult{false, "Parameter filename must be a string",
                              ToolError::MalformedInput};
        }
        if (!args["filename"].get<std::string>().empty()) {
            filename = args["filename"].get<std::string>();
        }
    }

    // Relative names resolve against the current directory.
    std::string path;
    if (auto err = check_sandbox_path(validator_, filename, true, path)) return *err;

    std::string content = render_template();

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return io_failure("Failed to create sample file", path,
                          std::error_code(errno, std::generic_category()));
    }
    file << content;
    file.close();
    if (file.fail()) {
        return ToolResult{false, "Failed to write sample file \"" + path + "\"",
                          ToolError::IOFailure};
    }

    ToolResult result{true, "Created sample file \"" + path + "\"\n\nContent:\n" + content};
    result.data = nlohmann::json{{"path", path}, {"content", content}};
    return result;
}

std::string CreateSampleFileTool::description() const {
    return "Create a sample file for testing (permitted directories only)";
}

std::string CreateSampleFileTool::parameters_json() const {
    return std::string(R"({"type":"object","properties":{"filename":{"type":"string","description":"Name of the file to create (default: )") +
           kDefaultFilename + ")\"}}}";
}

} // namespace fsgate
