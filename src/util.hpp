#pragma once
#include <string>
#include <cstddef>

namespace kankodori {

// Trim whitespace
std::string trim(const std::string& s);

// Number of UTF-8 code points in s
size_t utf8_length(const std::string& s);

// Parse a base-10 int. False for trailing garbage or values outside int.
bool parse_int(const std::string& s, int& out);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path.tmp, then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file in binary mode. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace kankodori
