#include "host_info.hpp"
#include "util.hpp"

#include <cstdlib>
#include <sys/utsname.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/sysinfo.h>
#else
#include <sys/sysctl.h>
#include <sys/time.h>
#include <ctime>
#endif

namespace fsgate {

nlohmann::json HostInfo::to_json() const {
    return {
        {"platform", platform},
        {"arch", arch},
        {"release", release},
        {"hostname", hostname},
        {"uptime_hours", uptime_hours},
        {"memory", {
            {"total_gb", total_memory_gb},
            {"free_gb", free_memory_gb}
        }},
        {"cpus", cpus},
        {"home_dir", home_dir},
        {"tmp_dir", tmp_dir}
    };
}

std::string normalize_arch(const std::string& machine) {
    if (machine == "x86_64" || machine == "amd64") return "x64";
    if (machine == "aarch64" || machine == "arm64") return "arm64";
    if (machine == "i386" || machine == "i686") return "ia32";
    if (machine.compare(0, 3, "arm") == 0) return "arm";
    return machine;
}

uint64_t bytes_to_gb(uint64_t bytes) {
    constexpr uint64_t gb = 1024ULL * 1024ULL * 1024ULL;
    return (bytes + gb / 2) / gb;
}

std::string temp_dir() {
    for (const char* var : {"TMPDIR", "TMP", "TEMP"}) {
        const char* v = std::getenv(var);
        if (v && *v) {
            std::string dir = v;
            while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
            return dir;
        }
    }
    return "/tmp";
}

HostInfo collect_host_info() {
    HostInfo info;

    struct utsname uts;
    if (uname(&uts) == 0) {
        info.platform = to_lower(uts.sysname);
        info.arch = normalize_arch(uts.machine);
        info.release = uts.release;
    }

    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) == 0) {
        info.hostname = host;
    }

#ifdef __linux__
    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        uint64_t unit = si.mem_unit ? si.mem_unit : 1;
        info.uptime_hours = static_cast<uint64_t>(si.uptime) / 3600;
        info.total_memory_gb = bytes_to_gb(static_cast<uint64_t>(si.totalram) * unit);
        info.free_memory_gb = bytes_to_gb(static_cast<uint64_t>(si.freeram) * unit);
    }
#else
    struct timeval boot;
    size_t len = sizeof(boot);
    int mib[2] = {CTL_KERN, KERN_BOOTTIME};
    if (sysctl(mib, 2, &boot, &len, nullptr, 0) == 0) {
        info.uptime_hours = static_cast<uint64_t>(std::time(nullptr) - boot.tv_sec) / 3600;
    }
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGESIZE);
    if (pages > 0 && page_size > 0) {
        info.total_memory_gb = bytes_to_gb(static_cast<uint64_t>(pages) *
                                           static_cast<uint64_t>(page_size));
    }
#endif

    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    info.cpus = cpus > 0 ? static_cast<unsigned>(cpus) : 1;

    info.home_dir = home_dir();
    info.tmp_dir = temp_dir();
    return info;
}

} // namespace fsgate
