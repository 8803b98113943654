#pragma once
#include <string>

namespace agnt {

// Local time with milliseconds, "YYYY-MM-DD HH:MM:SS.mmm"
std::string timestamp_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace agnt
