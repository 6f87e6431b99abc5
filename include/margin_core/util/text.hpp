#pragma once

#include <cstddef>
#include <string>

namespace margin_core::text {

// Returns the input with invalid UTF-8 sequences replaced by U+FFFD.
std::string sanitize_utf8(const std::string& input);

// Number of code points in a valid UTF-8 string.
size_t char_length(const std::string& utf8_text);

// First max_chars code points of a valid UTF-8 string. Never splits a code point.
std::string truncate_chars(const std::string& utf8_text, size_t max_chars);

std::string trim(const std::string& input);
std::string to_lower(const std::string& input);
bool is_blank(const std::string& input);

}  // namespace margin_core::text
