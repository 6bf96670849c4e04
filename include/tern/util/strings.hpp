#ifndef TERN_STRINGS_HPP
#define TERN_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "tern/util/chars.hpp"

namespace tern {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

/// @brief Returns `true` if `str` is a valid directive or argument name.
[[nodiscard]]
constexpr bool is_tern_identifier(std::u8string_view str) noexcept
{
    if (str.empty() || !is_tern_identifier_start(str[0])) {
        return false;
    }
    for (const char8_t c : str.substr(1)) {
        if (!is_tern_identifier(c)) {
            return false;
        }
    }
    return true;
}

/// @brief Converts all ASCII lower-case letters in `str` to upper case, in place.
constexpr void to_ascii_upper_inplace(std::span<char8_t> str) noexcept
{
    for (char8_t& c : str) {
        c = to_ascii_upper(c);
    }
}

/// @brief Converts all ASCII upper-case letters in `str` to lower case, in place.
constexpr void to_ascii_lower_inplace(std::span<char8_t> str) noexcept
{
    for (char8_t& c : str) {
        c = to_ascii_lower(c);
    }
}

/// @brief Returns the number of non-overlapping occurrences of `needle` in `haystack`.
/// `needle` shall not be empty.
[[nodiscard]]
constexpr std::size_t count_occurrences(std::u8string_view haystack, std::u8string_view needle)
{
    std::size_t result = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::u8string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++result;
    }
    return result;
}

} // namespace tern

#endif
