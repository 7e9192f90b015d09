/**
 * @file text_utils.cpp
 * @brief Lower-casing and UTF-16 length.
 */

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace commute {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t utf16_length(const std::string& utf8) {
    size_t units = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) == 0x80) continue;      // continuation byte
        units += (c & 0xF8) == 0xF0 ? 2 : 1;   // 4-byte sequence needs a surrogate pair
    }
    return units;
}

}  // namespace commute
