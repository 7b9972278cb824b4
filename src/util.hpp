#pragma once
#include <string>
#include <vector>

namespace dailyrun {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Expand ~ to the given home directory
std::string expand_home(const std::string& path, const std::string& home);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write via temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace dailyrun
