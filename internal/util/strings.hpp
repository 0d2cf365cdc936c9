#pragma once

#include <string>
#include <string_view>

namespace digest::util {

// ASCII case folding; non-ASCII bytes pass through unchanged.
std::string ToLower(std::string_view value);

std::string Trim(std::string_view value);

// Collapses runs of whitespace to a single space and trims the ends.
std::string CollapseWhitespace(std::string_view value);

std::string Truncate(std::string_view value, std::size_t max_chars);

} // namespace digest::util
