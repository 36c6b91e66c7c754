#ifndef pathjail_CORE_UTILS_HPP
#define pathjail_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace pathjail {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter. Interior empty fields are kept.
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// True when s is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF)
bool is_valid_utf8(const std::string& s);

// ============ Encoding utilities ============

// Standard base64 with padding
std::string base64_encode(const std::string& data);

// Returns false on malformed input
bool base64_decode(const std::string& text, std::string& out);

// ============ Random identifiers ============

// Random lowercase hex string of 2 * nbytes characters.
// Returns an empty string if the random source fails.
std::string random_hex(size_t nbytes);

} // namespace pathjail

#endif // pathjail_CORE_UTILS_HPP
