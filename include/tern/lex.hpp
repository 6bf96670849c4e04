#ifndef TERN_LEX_HPP
#define TERN_LEX_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "tern/fwd.hpp"

namespace tern {

/// @brief Returns the length of the whitespace (space, tab, CR, LF) at the start of `str`.
[[nodiscard]]
std::size_t match_whitespace(std::u8string_view str) noexcept;

/// @brief Returns the length of the identifier at the start of `str`, or zero.
/// Identifiers start with an ASCII letter or underscore,
/// followed by any amount of ASCII letters, digits, or underscores.
[[nodiscard]]
std::size_t match_identifier(std::u8string_view str) noexcept;

struct Boolean_Result {
    std::size_t length;
    bool value;

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return length != 0;
    }
};

/// @brief Matches `true` or `false` at the start of `str`.
[[nodiscard]]
Boolean_Result match_boolean(std::u8string_view str) noexcept;

/// @brief Returns the length of the string literal at the start of `str`, including
/// both delimiters, or zero if there is none.
/// The opening delimiter is one of `"`, `'`, or `` ` ``,
/// and the literal extends up to the next occurrence of the same delimiter.
/// There are no escape sequences.
[[nodiscard]]
std::size_t match_string(std::u8string_view str) noexcept;

/// @brief Returns the length of the decimal integer at the start of `str`, or zero.
/// The grammar is `-?(0|[1-9][0-9]*)`.
/// Note that for `01`, only the `0` is matched.
[[nodiscard]]
std::size_t match_integer(std::u8string_view str) noexcept;

/// @brief Returns the length of the decimal floating-point number at the start of `str`,
/// or zero.
/// The grammar is `-?(0|[1-9][0-9]*)\.[0-9]+`.
/// There is no exponent notation.
[[nodiscard]]
std::size_t match_float(std::u8string_view str) noexcept;

/// @brief Converts an integer literal as matched by `match_integer` to its value.
/// Returns `std::nullopt` if the value is not representable as `Integer`.
[[nodiscard]]
std::optional<Integer> parse_integer_literal(std::u8string_view literal);

/// @brief Converts a float literal as matched by `match_float` to its value.
/// Returns `std::nullopt` if the value is not representable as `Float`,
/// i.e. if it would be rounded to infinity.
/// Values too small to be represented are rounded to zero.
[[nodiscard]]
std::optional<Float> parse_float_literal(std::u8string_view literal);

/// @brief Returns the content of a string literal as matched by `match_string`,
/// i.e. the literal without its delimiters.
[[nodiscard]]
std::u8string_view string_literal_content(std::u8string_view literal);

} // namespace tern

#endif
