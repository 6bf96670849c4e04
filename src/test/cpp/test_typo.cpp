#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "tern/util/typo.hpp"

namespace tern {
namespace {

TEST(Typo, empty)
{
    constexpr std::span<std::u8string_view> haystack;
    constexpr std::u8string_view needle = u8"abc";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected {};
    EXPECT_FALSE(expected);

    const Distant actual = closest_match(haystack, needle, &memory);
    EXPECT_FALSE(actual);

    EXPECT_EQ(expected, actual);
}

TEST(Typo, exact_match)
{
    constexpr std::u8string_view haystack[] { u8"abc", u8"12345", u8"xyz" };
    constexpr std::u8string_view needle = u8"12345";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 0 };
    const Distant<std::size_t> actual = closest_match(haystack, needle, &memory);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, fuzzy_match)
{
    constexpr std::u8string_view haystack[] { u8"abc", u8"12345", u8"xyz" };
    constexpr std::u8string_view needle = u8"1234";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 1 };
    const Distant<std::size_t> actual = closest_match(haystack, needle, &memory);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, ties_prefer_earlier)
{
    constexpr std::u8string_view haystack[] { u8"upper", u8"abd", u8"abe" };
    constexpr std::u8string_view needle = u8"abc";

    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 1 };
    const Distant<std::size_t> actual = closest_match(haystack, needle, &memory);
    EXPECT_EQ(expected, actual);
}

TEST(Typo, is_plausible_typo)
{
    EXPECT_TRUE(is_plausible_typo(1, 5));
    EXPECT_TRUE(is_plausible_typo(2, 1));
    EXPECT_TRUE(is_plausible_typo(4, 5));
    EXPECT_FALSE(is_plausible_typo(5, 5));
    EXPECT_FALSE(is_plausible_typo(3, 1));
}

} // namespace
} // namespace tern
