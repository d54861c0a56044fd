#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace relaygate {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a 128-bit random ID rendered as 32 lowercase hex characters.
// Uses OpenSSL's CSPRNG; throws std::runtime_error if it cannot be seeded.
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Debug logging toggle (RELAYGATE_DEBUG or config "debug": true)
void set_debug_logging(bool enabled);
bool debug_logging_enabled();

// Print "[tag] message" to stderr when debug logging is enabled
void log_debug(const std::string& tag, const std::string& message);

} // namespace relaygate
