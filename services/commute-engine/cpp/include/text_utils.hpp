/**
 * @file text_utils.hpp
 * @brief Small string helpers shared by the search paths.
 */

#pragma once

#include <cstddef>
#include <string>

namespace commute {

/// ASCII lower-casing; bytes outside ASCII pass through unchanged.
std::string to_lower(std::string s);

/**
 * @brief Length of a UTF-8 string in UTF-16 code units.
 *
 * Query minimums are measured this way, so "日本" counts as 2 and an emoji
 * outside the BMP counts as 2. Malformed bytes count as one unit each.
 */
size_t utf16_length(const std::string& utf8);

}  // namespace commute
