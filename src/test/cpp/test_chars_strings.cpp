#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "tern/util/chars.hpp"
#include "tern/util/strings.hpp"

namespace tern {
namespace {

using namespace std::literals;

TEST(Chars, is_ascii_digit)
{
    EXPECT_FALSE(is_ascii_digit(u8'a'));
    for (char8_t digit = u8'0'; digit <= u8'9'; ++digit) {
        EXPECT_TRUE(is_ascii_digit(digit));
    }
}

TEST(Chars, is_tern_whitespace)
{
    for (const char8_t c : u8"\t\n\r "sv) {
        EXPECT_TRUE(is_tern_whitespace(c));
    }
    EXPECT_FALSE(is_tern_whitespace(u8'\f'));
    EXPECT_FALSE(is_tern_whitespace(u8'\v'));
    EXPECT_FALSE(is_tern_whitespace(u8'a'));
}

TEST(Chars, is_tern_identifier_start)
{
    EXPECT_TRUE(is_tern_identifier_start(u8'a'));
    EXPECT_TRUE(is_tern_identifier_start(u8'Z'));
    EXPECT_TRUE(is_tern_identifier_start(u8'_'));
    EXPECT_FALSE(is_tern_identifier_start(u8'0'));
    EXPECT_FALSE(is_tern_identifier_start(u8'-'));
    EXPECT_FALSE(is_tern_identifier_start(u8'\xC3'));
}

TEST(Chars, is_tern_identifier)
{
    EXPECT_TRUE(is_tern_identifier(u8'a'));
    EXPECT_TRUE(is_tern_identifier(u8'_'));
    EXPECT_TRUE(is_tern_identifier(u8'9'));
    EXPECT_FALSE(is_tern_identifier(u8'-'));
    EXPECT_FALSE(is_tern_identifier(u8'.'));
}

TEST(Chars, is_tern_quote)
{
    EXPECT_TRUE(is_tern_quote(u8'"'));
    EXPECT_TRUE(is_tern_quote(u8'\''));
    EXPECT_TRUE(is_tern_quote(u8'`'));
    EXPECT_FALSE(is_tern_quote(u8'a'));
}

TEST(Strings, is_tern_identifier)
{
    EXPECT_TRUE(is_tern_identifier(u8"x"sv));
    EXPECT_TRUE(is_tern_identifier(u8"_x1"sv));
    EXPECT_TRUE(is_tern_identifier(u8"regex_replace"sv));
    EXPECT_FALSE(is_tern_identifier(u8""sv));
    EXPECT_FALSE(is_tern_identifier(u8"1x"sv));
    EXPECT_FALSE(is_tern_identifier(u8"a-b"sv));
    EXPECT_FALSE(is_tern_identifier(u8"a b"sv));
}

TEST(Strings, to_ascii_upper_inplace)
{
    std::u8string str = u8"Hello, wörld_1!";
    to_ascii_upper_inplace(str);
    EXPECT_EQ(str, u8"HELLO, WöRLD_1!"sv);
}

TEST(Strings, to_ascii_lower_inplace)
{
    std::u8string str = u8"Hello, WÖRLD_1!";
    to_ascii_lower_inplace(str);
    EXPECT_EQ(str, u8"hello, wÖrld_1!"sv);
}

TEST(Strings, count_occurrences)
{
    static_assert(count_occurrences(u8"", u8"@@") == 0);
    static_assert(count_occurrences(u8"a@@b@@c", u8"@@") == 2);
    static_assert(count_occurrences(u8"@@@", u8"@@") == 1);
    static_assert(count_occurrences(u8"@@@@", u8"@@") == 2);
    EXPECT_EQ(count_occurrences(u8"xxxx"sv, u8"x"sv), 4);
}

} // namespace
} // namespace tern
