#ifndef TERN_TO_CHARS_HPP
#define TERN_TO_CHARS_HPP

#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>

#include "tern/util/assert.hpp"
#include "tern/util/meta.hpp"

namespace tern {

/// @brief Appends the decimal representation of `x` to `out`.
template <signed_or_unsigned T>
void append_integer(std::pmr::u8string& out, T x)
{
    char buffer[std::numeric_limits<T>::digits10 + 3];
    const std::to_chars_result result = std::to_chars(std::begin(buffer), std::end(buffer), x);
    TERN_ASSERT(result.ec == std::errc {});
    out.append(reinterpret_cast<const char8_t*>(buffer), std::size_t(result.ptr - buffer));
}

/// @brief Appends the shortest representation of `x` which round-trips to `out`.
/// If that representation looks like an integer (e.g. `1` for `1.0`),
/// `.0` is appended so that the result is still recognizable as floating-point.
/// Infinity and NaN are written as `inf`, `-inf`, and `nan`.
template <no_cv_floating T>
void append_float(std::pmr::u8string& out, T x)
{
    if (std::isnan(x)) {
        out += u8"nan";
        return;
    }
    if (std::isinf(x)) {
        out += x < 0 ? u8"-inf" : u8"inf";
        return;
    }
    // Large enough for the longest shortest-round-trip output of a double,
    // including sign and exponent.
    char buffer[64];
    const std::to_chars_result result = std::to_chars(std::begin(buffer), std::end(buffer), x);
    TERN_ASSERT(result.ec == std::errc {});
    const std::u8string_view chars { reinterpret_cast<const char8_t*>(buffer),
                                     std::size_t(result.ptr - buffer) };
    out += chars;
    if (chars.find_first_of(u8".e") == std::u8string_view::npos) {
        out += u8".0";
    }
}

} // namespace tern

#endif
