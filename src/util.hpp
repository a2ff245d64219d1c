#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace sift {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// ISO 8601 timestamp for the given epoch seconds (UTC)
std::string format_timestamp(uint64_t epoch);

// Current date as YYYY-MM-DD (UTC)
std::string date_today();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// True if s is empty or whitespace only
bool is_blank(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Generate an unguessable 128-bit token (hex), used for stream handles
std::string generate_token();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file; throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

// Standard base64 (RFC 4648) with padding
std::string base64_encode(const std::string& data);

// Shorten for log lines
std::string truncate_for_log(const std::string& s, size_t max_len = 60);

} // namespace sift
