#ifndef TERN_CHARS_HPP
#define TERN_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"

namespace tern {

using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief Returns `true` if `c` is whitespace within a directive call.
/// Unlike `is_ascii_whitespace`, form feeds are not included.
[[nodiscard]]
constexpr bool is_tern_whitespace(char8_t c) noexcept
{
    return c == u8' ' || c == u8'\t' || c == u8'\r' || c == u8'\n';
}

/// @brief Returns `true` if `c` can begin a directive or argument name.
[[nodiscard]]
constexpr bool is_tern_identifier_start(char8_t c) noexcept
{
    return is_ascii_alpha(c) || c == u8'_';
}

/// @brief Returns `true` if `c` can appear after the first character
/// of a directive or argument name.
[[nodiscard]]
constexpr bool is_tern_identifier(char8_t c) noexcept
{
    return is_ascii_alphanumeric(c) || c == u8'_';
}

/// @brief Returns `true` if `c` can open (and close) a string literal.
[[nodiscard]]
constexpr bool is_tern_quote(char8_t c) noexcept
{
    return c == u8'"' || c == u8'\'' || c == u8'`';
}

} // namespace tern

#endif
