#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace fsgate;

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: struct defaults", "[config]") {
    Config cfg;
    REQUIRE(cfg.server.name == "fsgate");
    REQUIRE(cfg.server.protocol_version == "2025-06-18");
    REQUIRE(cfg.sandbox.resolve_symlinks);
    REQUIRE(cfg.tools.max_read_bytes == 10 * 1024 * 1024);
}

TEST_CASE("Config::defaults_json: sandbox lists", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j["sandbox"]["allowed_roots"].size() == 1);
    REQUIRE(j["sandbox"]["allowed_extensions"].size() == 22);
    REQUIRE(j["sandbox"]["blocked_roots"].size() == 12);
    REQUIRE(j["sandbox"]["resolve_symlinks"] == true);
    REQUIRE(j["tools"]["max_read_bytes"] == 10 * 1024 * 1024);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads all sections", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": { "name": "custom", "protocol_version": "2024-11-05" },
        "sandbox": {
            "allowed_roots": ["/srv/data", "/srv/more"],
            "blocked_roots": ["/srv/data/private"],
            "allowed_extensions": [".txt"],
            "resolve_symlinks": false
        },
        "tools": { "max_read_bytes": 4096 }
    })");
    auto cfg = Config::from_json(j);
    REQUIRE(cfg.server.name == "custom");
    REQUIRE(cfg.server.protocol_version == "2024-11-05");
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{"/srv/data", "/srv/more"});
    REQUIRE(cfg.sandbox.blocked_roots == std::vector<std::string>{"/srv/data/private"});
    REQUIRE(cfg.sandbox.allowed_extensions == std::vector<std::string>{".txt"});
    REQUIRE_FALSE(cfg.sandbox.resolve_symlinks);
    REQUIRE(cfg.tools.max_read_bytes == 4096);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "server": { "name": 42 },
        "sandbox": { "allowed_roots": ["/ok", 7, null], "resolve_symlinks": "no" },
        "tools": { "max_read_bytes": -1 }
    })");
    auto cfg = Config::from_json(j);
    REQUIRE(cfg.server.name == "fsgate");
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{"/ok"});
    REQUIRE(cfg.sandbox.resolve_symlinks);
    REQUIRE(cfg.tools.max_read_bytes == 10 * 1024 * 1024);
}

TEST_CASE("Config::from_json: empty object", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::object());
    REQUIRE(cfg.sandbox.allowed_roots.empty());
    REQUIRE(cfg.sandbox.allowed_extensions.empty());
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "fsgate_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("FSGATE_ALLOWED_ROOTS");
        unsetenv("FSGATE_BLOCKED_ROOTS");
        unsetenv("FSGATE_ALLOWED_EXTENSIONS");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("FSGATE_ALLOWED_ROOTS");
        unsetenv("FSGATE_BLOCKED_ROOTS");
        unsetenv("FSGATE_ALLOWED_EXTENSIONS");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.fsgate/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.fsgate");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

TEST_CASE("Config::load: missing file writes defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    auto cfg = Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(nlohmann::json::parse(g.read_config()) == Config::defaults_json());

    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{g.dir + "/Documents/00_AI_Area"});
    REQUIRE(contains(cfg.sandbox.blocked_roots, "/etc"));
    REQUIRE(contains(cfg.sandbox.blocked_roots, g.dir + "/.ssh"));
    REQUIRE(contains(cfg.sandbox.allowed_extensions, ".md"));
    REQUIRE(cfg.sandbox.allowed_extensions.size() == 22);
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "server": { "name": "docs-gate" },
        "sandbox": {
            "allowed_roots": ["~/work"],
            "blocked_roots": [],
            "allowed_extensions": [".txt", ".md"],
            "resolve_symlinks": false
        }
    })");

    auto cfg = Config::load();
    REQUIRE(cfg.server.name == "docs-gate");
    REQUIRE(cfg.server.protocol_version == "2025-06-18");
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{g.dir + "/work"});
    REQUIRE(cfg.sandbox.blocked_roots.empty());
    REQUIRE(cfg.sandbox.allowed_extensions.size() == 2);
    REQUIRE_FALSE(cfg.sandbox.resolve_symlinks);
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/elsewhere.json";
    {
        std::ofstream f(path);
        f << R"({"sandbox":{"allowed_roots":["/srv/share"]}})";
    }

    auto cfg = Config::load(path);
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{"/srv/share"});
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: migrates missing keys into file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"sandbox":{"allowed_roots":["/srv/share"]}})");
    auto cfg = Config::load();
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{"/srv/share"});
    REQUIRE(cfg.sandbox.allowed_extensions.size() == 22);

    auto written = nlohmann::json::parse(g.read_config());
    REQUIRE(written.contains("server"));
    REQUIRE(written.contains("tools"));
    REQUIRE(written["sandbox"].contains("blocked_roots"));
    REQUIRE(written["sandbox"]["allowed_roots"] == nlohmann::json::array({"/srv/share"}));
}

TEST_CASE("Config::load: complete file left untouched", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string content = Config::defaults_json().dump();
    g.write_config(content);
    Config::load();
    REQUIRE(g.read_config() == content);
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ not json");
    auto cfg = Config::load();
    REQUIRE(cfg.sandbox.allowed_roots == std::vector<std::string>{g.dir + "/Documents/00_AI_Area"});
    REQUIRE(g.read_config() == "{ not json");
}

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"sandbox":{"allowed_roots":["/from/file"]}})");
    setenv("FSGATE_ALLOWED_ROOTS", "/env/one: ~/env-two ::", 1);
    setenv("FSGATE_BLOCKED_ROOTS", "/env/one/private", 1);
    setenv("FSGATE_ALLOWED_EXTENSIONS", ".txt, .csv", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.sandbox.allowed_roots ==
            std::vector<std::string>{"/env/one", g.dir + "/env-two"});
    REQUIRE(cfg.sandbox.blocked_roots == std::vector<std::string>{"/env/one/private"});
    REQUIRE(cfg.sandbox.allowed_extensions == std::vector<std::string>{".txt", ".csv"});
}

TEST_CASE("Config::load: empty extension env var permits all", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("FSGATE_ALLOWED_EXTENSIONS", "", 1);
    auto cfg = Config::load();
    REQUIRE(cfg.sandbox.allowed_extensions.empty());
}
