#include "write_file.hpp"
#include "tool_util.hpp"
#include <cerrno>
#include <fstream>
#include <filesystem>

namespace fsgate {

ToolResult WriteFileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "filepath")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    std::string path;
    if (auto err = check_sandbox_path(validator_, args["filepath"].get<std::string>(),
                                      true, path)) {
        return *err;
    }
    std::string content = args["content"].get<std::string>();

    std::filesystem::path fs_path(path);
    if (fs_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) return io_failure("Failed to create directories for", path, ec);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return io_failure("Failed to open file for writing", path,
                          std::error_code(errno, std::generic_category()));
    }

    file << content;
    file.close();

    if (file.fail()) {
        return ToolResult{false, "Failed to write to file \"" + path + "\"",
                          ToolError::IOFailure};
    }

    return ToolResult{true, "Wrote " + std::to_string(content.size()) +
                            " bytes to \"" + path + "\""};
}

std::string WriteFileTool::description() const {
    return "Write text to a file, creating it and its parent directories if needed "
           "(permitted directories only)";
}

std::string WriteFileTool::parameters_json() const {
    return R"({"type":"object","properties":{"filepath":{"type":"string","description":"Path of the file to write"},"content":{"type":"string","description":"Text to write"}},"required":["filepath","content"]})";
}

} // namespace fsgate
