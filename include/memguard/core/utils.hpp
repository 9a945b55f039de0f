#ifndef MEMGUARD_CORE_UTILS_HPP
#define MEMGUARD_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace memguard {

// ============ Math utilities ============

template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 UTC (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Shell glob match ('*', '?', '[...]'); '*' also crosses '/'
bool glob_match(const std::string& pattern, const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Compute SHA256 hash as hex string
std::string sha256_hex(const std::string& data);

} // namespace memguard

#endif // MEMGUARD_CORE_UTILS_HPP
