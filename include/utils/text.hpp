#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace pwv {
namespace utils {

// ---- STRING HELPERS ----
// Returns copy of s without leading and trailing Unicode White_Space (s is UTF-8)
std::string trim(const std::string& s);
// Checks that bytes form well-formed UTF-8 (no overlongs, no surrogates, max U+10FFFF)
bool is_valid_utf8(const std::string& s);
bool is_valid_utf8(const std::vector<uint8_t>& bytes);

} // namespace utils
} // namespace pwv
