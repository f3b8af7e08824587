#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace edfconv {

std::string trim(const std::string& s);

// Remove trailing whitespace only.
//
// EDF text fields are left-aligned and space padded, so the padding lives on
// the right. Leading and internal spacing is part of the value and is kept.
std::string trim_right(const std::string& s);

std::vector<std::string> split(const std::string& s, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// Strict numeric parsing for header fields: surrounding whitespace is ignored,
// the rest must be one complete number in the classic "C" locale.
// Throw std::runtime_error on failure; never return a default.
long long to_int64(const std::string& s);
double to_double(const std::string& s);

bool file_exists(const std::string& path);

// Create the parent directory of `path` if it has one.
void ensure_parent_dir(const std::string& path);

// Escape a string for safe inclusion in JSON string values.
// The returned string does NOT include surrounding quotes.
std::string json_escape(const std::string& s);

// Format a double for JSON output ("null" for non-finite values). Uses
// max_digits10 significant digits so the value parses back unchanged.
std::string json_number(double x);

} // namespace edfconv
