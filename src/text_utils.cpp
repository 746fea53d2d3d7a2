#include "text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace code_context {

size_t utf8_length(const std::string& str) {
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string utf8_prefix(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if ((static_cast<unsigned char>(str[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return str.substr(0, i);
        ++chars;
    }
    return str;
}

std::string sanitize_utf8(const std::string& str) {
    std::string safe_str;
    safe_str.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len > 0 && i + len <= str.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if ((cc & 0xC0) != 0x80) valid = false;
        }

        if (valid) {
            safe_str.append(str, i, len);
            i += len;
        } else {
            safe_str += '?';
            ++i;
        }
    }
    return safe_str;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = content.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string trim(const std::string& str) {
    const char* ws = " \t\r\n\f\v";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace code_context
