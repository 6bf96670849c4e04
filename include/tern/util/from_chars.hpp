#ifndef TERN_FROM_CHARS_HPP
#define TERN_FROM_CHARS_HPP

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

#include "tern/util/meta.hpp"
#include "tern/util/result.hpp"
#include "tern/util/strings.hpp"

namespace tern {

// INTEGRAL ====================================================================

template <signed_or_unsigned T>
[[nodiscard]]
std::from_chars_result from_characters(std::string_view sv, T& out, int base = 10)
{
    return std::from_chars(sv.data(), sv.data() + sv.size(), out, base);
}

/// @brief Converts the whole of `sv` to an integer.
/// Returns `std::nullopt` if `sv` is not entirely an integer
/// or if the value is not representable by `T`.
template <signed_or_unsigned T>
[[nodiscard]]
std::optional<T> from_characters(std::string_view sv, int base = 10)
{
    std::optional<T> result;
    const auto r = from_characters(sv, result.emplace(), base);
    if (r.ec != std::errc {} || r.ptr != sv.data() + sv.size()) {
        result.reset();
    }
    return result;
}

template <signed_or_unsigned T>
[[nodiscard]]
std::optional<T> from_characters(std::u8string_view sv, int base = 10)
{
    return from_characters<T>(as_string_view(sv), base);
}

// FLOATING POINT ==============================================================

template <no_cv_floating T>
[[nodiscard]]
std::from_chars_result
from_characters(std::string_view sv, T& out, std::chars_format fmt = std::chars_format::general)
{
    return std::from_chars(sv.data(), sv.data() + sv.size(), out, fmt);
}

/// @brief Converts the whole of `sv` to a floating-point number.
/// Partial matches result in `std::errc::invalid_argument`.
template <no_cv_floating T>
[[nodiscard]]
Result<T, std::errc>
from_characters(std::string_view sv, std::chars_format fmt = std::chars_format::general)
{
    T result;
    const auto r = from_characters(sv, result, fmt);
    if (r.ec != std::errc {}) {
        return r.ec;
    }
    if (r.ptr != sv.data() + sv.size()) {
        return std::errc::invalid_argument;
    }
    return result;
}

template <no_cv_floating T>
[[nodiscard]]
Result<T, std::errc>
from_characters(std::u8string_view sv, std::chars_format fmt = std::chars_format::general)
{
    return from_characters<T>(as_string_view(sv), fmt);
}

} // namespace tern

#endif
