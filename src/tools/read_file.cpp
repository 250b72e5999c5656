#include "read_file.hpp"
#include "tool_util.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fsgate {

ReadFileTool::ReadFileTool(const PathValidator& validator, uint64_t max_bytes)
    : validator_(validator), max_bytes_(max_bytes) {}

ToolResult ReadFileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "filepath")) return *err;

    std::string path;
    if (auto err = check_sandbox_path(validator_, args["filepath"].get<std::string>(),
                                      true, path)) {
        return *err;
    }

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) return io_failure("Failed to read file", path, ec);
    if (std::filesystem::is_directory(status)) {
        return io_failure("Failed to read file", path,
                          std::make_error_code(std::errc::is_a_directory));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return ToolResult{false, "Failed to read file \"" + path + "\": not a regular file",
                          ToolError::IOFailure};
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) return io_failure("Failed to read file", path, ec);
    if (size > max_bytes_) {
        return ToolResult{false, "Failed to read file \"" + path + "\": file is " +
                                 std::to_string(size) + " bytes, limit is " +
                                 std::to_string(max_bytes_),
                          ToolError::IOFailure};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_failure("Failed to open file", path,
                          std::error_code(errno, std::generic_category()));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ToolResult{false, "Failed to read file \"" + path + "\": read error",
                          ToolError::IOFailure};
    }

    return ToolResult{true, "Contents of \"" + path + "\":\n\n" + ss.str()};
}

std::string ReadFileTool::description() const {
    return "Read the contents of a text file (permitted directories only)";
}

std::string ReadFileTool::parameters_json() const {
    return R"({"type":"object","properties":{"filepath":{"type":"string","description":"Path of the file to read"}},"required":["filepath"]})";
}

} // namespace fsgate
