#pragma once

#include <string>

namespace galaxis {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file through a temporary sibling + rename so a crash never
// leaves a truncated snapshot behind. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace galaxis
