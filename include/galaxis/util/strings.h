#pragma once

#include <string>
#include <vector>

namespace galaxis {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on `sep`. Empty fields are kept, so "1,,2" yields three parts.
std::vector<std::string> split(const std::string& s, char sep);

// Parses a non-negative decimal integer. Returns false on any stray character.
bool parse_u64(const std::string& s, unsigned long long* out);

} // namespace galaxis
