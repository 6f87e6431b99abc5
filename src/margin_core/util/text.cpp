#include "margin_core/util/text.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace margin_core::text {

std::string sanitize_utf8(const std::string& input) {
  if (utf8::is_valid(input.begin(), input.end())) {
    return input;
  }
  std::string out;
  utf8::replace_invalid(input.begin(), input.end(), std::back_inserter(out));
  return out;
}

size_t char_length(const std::string& utf8_text) {
  return static_cast<size_t>(utf8::distance(utf8_text.begin(), utf8_text.end()));
}

std::string truncate_chars(const std::string& utf8_text, size_t max_chars) {
  auto it = utf8_text.begin();
  for (size_t count = 0; count < max_chars && it != utf8_text.end(); ++count) {
    utf8::next(it, utf8_text.end());
  }
  return std::string(utf8_text.begin(), it);
}

std::string trim(const std::string& input) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return "";
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& input) {
  std::string out = input;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool is_blank(const std::string& input) {
  return std::all_of(input.begin(), input.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace margin_core::text
