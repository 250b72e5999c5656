#pragma once
#include <string>
#include <vector>

namespace fsgate {

// Local wall-clock time, "YYYY-MM-DD HH:MM:SS"
std::string local_time_now();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Join with separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Home directory from $HOME, falling back to the passwd entry
std::string home_dir();

// Write via temp file + rename, creating parent directories
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace fsgate
