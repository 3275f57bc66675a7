#pragma once
#include <string>

namespace tokflow {

// Trim whitespace
std::string trim(const std::string& s);

// True when s is non-empty and every character is a hex digit
bool is_hex_digits(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file beside path, then rename over it.
// Creates the parent directory if needed. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace tokflow
