#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace text {

inline std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

// Number of code points in a UTF-8 string. Continuation bytes (10xxxxxx)
// are not counted, so malformed input still yields a bounded result.
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace text
