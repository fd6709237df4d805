#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace netstash {

// ISO 8601 timestamp for the current time
std::string timestamp_now();

// ISO 8601 timestamp for a Unix epoch in milliseconds
std::string timestamp_from_millis(uint64_t epoch_ms);

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Join a directory and a file name with exactly one separator
std::string path_join(const std::string& dir, const std::string& name);

// Write via temp file + rename so readers never see a partial file.
// Creates the parent directory when missing.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace netstash
