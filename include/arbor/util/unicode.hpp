// include/arbor/util/unicode.hpp
// @brief UTF-8 decoding and terminal display-width helpers.
// @invariant Invalid input bytes decode to U+FFFD, one per offending byte.
// @ownership Returned strings are owned by the caller.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace arbor::util
{

/// @brief Decode UTF-8 text into code points.
/// @details Overlong encodings, surrogates, values above U+10FFFF and stray
///          continuation bytes each yield one U+FFFD per consumed byte.
std::u32string decode_utf8(std::string_view text);

/// @brief Number of terminal columns occupied by code point @p cp.
/// @return 0 for combining marks, zero-width and control characters, 2 for
///         East Asian wide and emoji ranges, 1 otherwise.
int char_width(char32_t cp);

/// @brief Display-column width of UTF-8 @p text.
std::size_t display_width(std::string_view text);

/// @brief Byte length of the first @p count code points of @p text.
std::size_t utf8_prefix(std::string_view text, std::size_t count);

/// @brief Number of code points in @p text.
std::size_t utf8_length(std::string_view text);

} // namespace arbor::util
