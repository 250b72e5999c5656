#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace fsgate {

// Snapshot of the host environment. All fields are read once; nothing
// here has side effects.
struct HostInfo {
    std::string platform;      // "linux", "darwin", ...
    std::string arch;          // "x64", "arm64", ...
    std::string release;       // kernel release
    std::string hostname;
    uint64_t uptime_hours = 0; // rounded down
    uint64_t total_memory_gb = 0;
    uint64_t free_memory_gb = 0;
    unsigned cpus = 0;
    std::string home_dir;
    std::string tmp_dir;

    nlohmann::json to_json() const;
};

HostInfo collect_host_info();

// Map a uname machine string onto the short names clients expect
std::string normalize_arch(const std::string& machine);

// Bytes to whole gigabytes, rounded to nearest
uint64_t bytes_to_gb(uint64_t bytes);

// $TMPDIR / $TMP / $TEMP, else /tmp; trailing separator removed
std::string temp_dir();

} // namespace fsgate
