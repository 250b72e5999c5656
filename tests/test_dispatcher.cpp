#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "dispatcher.hpp"
#include "path_validator.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace fsgate;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "fsgate_disp_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    if (!result) return "";
    return std::filesystem::canonical(result).string();
}

// ── Mock tools ───────────────────────────────────────────────────

class EchoTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override {
        return ToolResult{true, args_json};
    }
    std::string tool_name() const override { return "echo"; }
    std::string description() const override { return "Echo arguments"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

class ThrowingTool : public Tool {
public:
    ToolResult execute(const std::string&) override {
        throw std::runtime_error("disk on fire");
    }
    std::string tool_name() const override { return "boom"; }
    std::string description() const override { return "Always throws"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

static ToolDispatcher mock_dispatcher() {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    tools.push_back(std::make_unique<ThrowingTool>());
    return ToolDispatcher(std::move(tools));
}

// ── dispatch_tool ────────────────────────────────────────────────

TEST_CASE("dispatch_tool: finds tool by name", "[dispatcher]") {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    auto result = dispatch_tool("echo", R"({"a":1})", tools);
    REQUIRE(result.success);
    REQUIRE(result.output == R"({"a":1})");
}

TEST_CASE("dispatch_tool: unknown tool", "[dispatcher]") {
    std::vector<std::unique_ptr<Tool>> tools;
    auto result = dispatch_tool("nonexistent", "{}", tools);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ToolError::UnknownOperation);
    REQUIRE(result.output == "Unknown tool: nonexistent");
}

// ── ToolDispatcher ───────────────────────────────────────────────

TEST_CASE("ToolDispatcher: passes object arguments through", "[dispatcher]") {
    auto d = mock_dispatcher();
    auto result = d.dispatch("echo", {{"filepath", "/x"}});
    REQUIRE(result.success);
    REQUIRE(nlohmann::json::parse(result.output)["filepath"] == "/x");
}

TEST_CASE("ToolDispatcher: null arguments become empty object", "[dispatcher]") {
    auto d = mock_dispatcher();
    auto result = d.dispatch("echo", nullptr);
    REQUIRE(result.success);
    REQUIRE(result.output == "{}");
}

TEST_CASE("ToolDispatcher: non-object arguments are malformed", "[dispatcher]") {
    auto d = mock_dispatcher();
    for (const auto& bad : {nlohmann::json::array({1, 2}), nlohmann::json("text"),
                            nlohmann::json(3)}) {
        auto result = d.dispatch("echo", bad);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolError::MalformedInput);
    }
}

TEST_CASE("ToolDispatcher: unknown operation", "[dispatcher]") {
    auto d = mock_dispatcher();
    auto result = d.dispatch("delete_everything", nlohmann::json::object());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ToolError::UnknownOperation);
    REQUIRE(result.output.find("delete_everything") != std::string::npos);
}

TEST_CASE("ToolDispatcher: throwing tool becomes IO failure", "[dispatcher]") {
    auto d = mock_dispatcher();
    ToolResult result{true, ""};
    REQUIRE_NOTHROW(result = d.dispatch("boom", nlohmann::json::object()));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ToolError::IOFailure);
    REQUIRE(result.output.find("disk on fire") != std::string::npos);

    // Next request still served
    REQUIRE(d.dispatch("echo", nlohmann::json::object()).success);
}

TEST_CASE("ToolDispatcher: specs and names follow registration order", "[dispatcher]") {
    auto d = mock_dispatcher();
    REQUIRE(d.tool_names() == std::vector<std::string>{"echo", "boom"});
    auto specs = d.specs();
    REQUIRE(specs.size() == 2);
    REQUIRE(specs[0].name == "echo");
    REQUIRE(specs[0].description == "Echo arguments");
    REQUIRE(specs[1].parameters_json == R"({"type":"object"})");
}

TEST_CASE("ToolDispatcher: built-in tools write then read", "[dispatcher]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    {
        PathValidator validator(SandboxPolicy({dir}, {}, {".txt"}));
        Config cfg;
        ToolDispatcher d(validator, cfg);
        REQUIRE(d.tool_names().size() == 6);

        auto file = dir + "/sub/dir/f.txt";
        auto wrote = d.dispatch("write_file", {{"filepath", file}, {"content", "payload"}});
        REQUIRE(wrote.success);

        auto read = d.dispatch("read_file", {{"filepath", file}});
        REQUIRE(read.success);
        REQUIRE(read.output.find("payload") != std::string::npos);

        auto missing = d.dispatch("read_file", {{"filepath", dir + "/missing.txt"}});
        REQUIRE_FALSE(missing.success);
        REQUIRE(missing.error == ToolError::IOFailure);

        auto listed = d.dispatch("list_directory", {{"dirpath", dir}});
        REQUIRE(listed.success);
        REQUIRE(listed.output.find("[dir] sub") != std::string::npos);

        auto denied = d.dispatch("read_file", {{"filepath", "/etc/hostname"}});
        REQUIRE_FALSE(denied.success);
        REQUIRE(denied.error == ToolError::PolicyDenied);
    }
    std::filesystem::remove_all(dir);
}

// ── format_tool_result ───────────────────────────────────────────

TEST_CASE("format_tool_result: success", "[dispatcher]") {
    auto j = format_tool_result(ToolResult{true, "done"});
    REQUIRE(j["isError"] == false);
    REQUIRE(j["content"].size() == 1);
    REQUIRE(j["content"][0]["type"] == "text");
    REQUIRE(j["content"][0]["text"] == "done");
    REQUIRE_FALSE(j.contains("structuredContent"));
}

TEST_CASE("format_tool_result: error text prefixed", "[dispatcher]") {
    auto j = format_tool_result(ToolResult{false, "Access denied", ToolError::PolicyDenied});
    REQUIRE(j["isError"] == true);
    REQUIRE(j["content"][0]["text"] == "Error: Access denied");
}

TEST_CASE("format_tool_result: structured data attached", "[dispatcher]") {
    ToolResult r{true, "listing"};
    r.data = nlohmann::json{{"entries", nlohmann::json::array()}};
    auto j = format_tool_result(r);
    REQUIRE(j.contains("structuredContent"));
    REQUIRE(j["structuredContent"]["entries"].is_array());
}
