#pragma once
#include <string>
#include <vector>

namespace code_context {

// Code points in a UTF-8 string (continuation bytes are not counted).
size_t utf8_length(const std::string& str);

// First `max_chars` code points, never splitting a sequence.
std::string utf8_prefix(const std::string& str, size_t max_chars);

std::string sanitize_utf8(const std::string& str);

// Splits on '\n' only; "a\n" yields {"a", ""}. Never returns an empty vector.
std::vector<std::string> split_lines(const std::string& content);

std::string trim(const std::string& str);
std::string to_lower(std::string str);

} // namespace code_context
