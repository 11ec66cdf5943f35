#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace trip_atlas::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::string collapse_whitespace(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string format_fixed(double value, int decimals);

// Case-insensitive ordering; equal-ignoring-case strings fall back to byte order
int compare_ci(const std::string& a, const std::string& b);
bool less_ci(const std::string& a, const std::string& b);

// Percent-encoding with the unreserved set of encodeURIComponent
std::string encode_uri_component(const std::string& s);

} // namespace trip_atlas::core
