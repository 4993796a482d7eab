#ifndef RANKPOLL_CORE_UTILS_HPP
#define RANKPOLL_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace rankpoll {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Split string by delimiter (empty parts are kept)
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Identifier utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// Compute SHA256 hash as lowercase hex string (64 chars)
std::string sha256_hex(const std::string& data);

// True if s is exactly 64 lowercase hex characters
bool is_hex_digest(const std::string& s);

} // namespace rankpoll

#endif // RANKPOLL_CORE_UTILS_HPP
