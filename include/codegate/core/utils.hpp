#ifndef codegate_CORE_UTILS_HPP
#define codegate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <ctime>

namespace codegate {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds from a monotonic clock (for deadlines and durations)
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Sanitize a string for safe JSON serialization
// Replaces invalid UTF-8 sequences and problematic control characters
std::string sanitize_utf8(const std::string& s);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Directory for scratch files: $TMPDIR if set, otherwise /tmp
std::string default_temp_dir();

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// Time, pid and call-count mixed bytes. Used by generate_uuid() when the
// OpenSSL RNG fails; distinct per call and per process, not secret.
void fallback_random_bytes(unsigned char* out, size_t len);

} // namespace codegate

#endif // codegate_CORE_UTILS_HPP
