#include "list_directory.hpp"
#include "tool_util.hpp"
#include <filesystem>

namespace fsgate {

ToolResult ListDirectoryTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "dirpath")) return *err;

    // Directories have no extension semantics.
    std::string path;
    if (auto err = check_sandbox_path(validator_, args["dirpath"].get<std::string>(),
                                      false, path)) {
        return *err;
    }

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) return io_failure("Failed to list directory", path, ec);
    if (!std::filesystem::is_directory(status)) {
        return io_failure("Failed to list directory", path,
                          std::make_error_code(std::errc::not_a_directory));
    }

    std::filesystem::directory_iterator it(path, ec);
    if (ec) return io_failure("Failed to list directory", path, ec);

    nlohmann::json entries = nlohmann::json::array();
    std::string listing;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        // Symlinks are tagged by their target; dangling ones count as files.
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        std::string name = it->path().filename().string();

        entries.push_back({{"name", name}, {"type", is_dir ? "directory" : "file"}});
        listing += (is_dir ? "[dir] " : "[file] ") + name + "\n";
    }
    if (ec) return io_failure("Failed to list directory", path, ec);

    std::string output = "Contents of directory \"" + path + "\":\n\n";
    output += listing.empty() ? "(empty)" : listing.substr(0, listing.size() - 1);

    ToolResult result{true, output};
    result.data = nlohmann::json{{"path", path}, {"entries", entries}};
    return result;
}

std::string ListDirectoryTool::description() const {
    return "List the files and subdirectories of a directory (permitted directories only)";
}

std::string ListDirectoryTool::parameters_json() const {
    return R"({"type":"object","properties":{"dirpath":{"type":"string","description":"Path of the directory to list"}},"required":["dirpath"]})";
}

} // namespace fsgate
