#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "ulight/impl/ascii_algorithm.hpp"

#include "tern/util/assert.hpp"
#include "tern/util/chars.hpp"
#include "tern/util/from_chars.hpp"

#include "tern/fwd.hpp"
#include "tern/lex.hpp"

using namespace std::string_view_literals;

namespace tern {
namespace {

/// @brief Matches `0|[1-9][0-9]*`, i.e. the digits of an integer without sign.
[[nodiscard]]
std::size_t match_digits_without_leading_zero(std::u8string_view str) noexcept
{
    if (str.empty() || !is_ascii_digit(str[0])) {
        return 0;
    }
    if (str[0] == u8'0') {
        return 1;
    }
    return ulight::ascii::length_if(str, [](char8_t c) { return is_ascii_digit(c); });
}

/// @brief Matches the optional minus sign and the integer part shared by integers and floats.
[[nodiscard]]
std::size_t match_integer_part(std::u8string_view str) noexcept
{
    const std::size_t sign_length = str.starts_with(u8'-') ? 1 : 0;
    const std::size_t digits = match_digits_without_leading_zero(str.substr(sign_length));
    return digits == 0 ? 0 : sign_length + digits;
}

} // namespace

std::size_t match_whitespace(std::u8string_view str) noexcept
{
    return ulight::ascii::length_if(str, [](char8_t c) { return is_tern_whitespace(c); });
}

std::size_t match_identifier(std::u8string_view str) noexcept
{
    if (str.empty() || !is_tern_identifier_start(str[0])) {
        return 0;
    }
    return 1 + ulight::ascii::length_if(str.substr(1), [](char8_t c) {
               return is_tern_identifier(c);
           });
}

Boolean_Result match_boolean(std::u8string_view str) noexcept
{
    if (str.starts_with(u8"true")) {
        return { 4, true };
    }
    if (str.starts_with(u8"false")) {
        return { 5, false };
    }
    return { 0, false };
}

std::size_t match_string(std::u8string_view str) noexcept
{
    if (str.empty() || !is_tern_quote(str[0])) {
        return 0;
    }
    const std::size_t closing = str.find(str[0], 1);
    return closing == std::u8string_view::npos ? 0 : closing + 1;
}

std::size_t match_integer(std::u8string_view str) noexcept
{
    return match_integer_part(str);
}

std::size_t match_float(std::u8string_view str) noexcept
{
    const std::size_t integer_length = match_integer_part(str);
    if (integer_length == 0 || integer_length >= str.length() || str[integer_length] != u8'.') {
        return 0;
    }
    const std::size_t fraction_length = ulight::ascii::length_if(
        str.substr(integer_length + 1), [](char8_t c) { return is_ascii_digit(c); }
    );
    return fraction_length == 0 ? 0 : integer_length + 1 + fraction_length;
}

std::optional<Integer> parse_integer_literal(std::u8string_view literal)
{
    TERN_DEBUG_ASSERT(match_integer(literal) == literal.length());
    return from_characters<Integer>(literal);
}

std::optional<Float> parse_float_literal(std::u8string_view literal)
{
    TERN_DEBUG_ASSERT(match_float(literal) == literal.length());
    const Result<Float, std::errc> result
        = from_characters<Float>(literal, std::chars_format::fixed);
    if (result) {
        return *result;
    }
    // Without an exponent, only literals with a zero integer part can underflow.
    // Those round to zero, whereas a nonzero integer part out of range is infinite.
    const bool negative = literal.starts_with(u8'-');
    const bool zero_integer_part = literal.substr(negative ? 1 : 0).starts_with(u8"0."sv);
    if (result.error() == std::errc::result_out_of_range && zero_integer_part) {
        return negative ? -Float {} : Float {};
    }
    return std::nullopt;
}

std::u8string_view string_literal_content(std::u8string_view literal)
{
    TERN_ASSERT(literal.length() >= 2);
    TERN_ASSERT(is_tern_quote(literal.front()) && literal.back() == literal.front());
    return literal.substr(1, literal.length() - 2);
}

} // namespace tern
