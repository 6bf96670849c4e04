#include <limits>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "tern/fwd.hpp"
#include "tern/literal.hpp"

namespace tern {
namespace {

using namespace std::string_view_literals;

[[nodiscard]]
std::pmr::u8string to_text(const Literal& literal)
{
    std::pmr::u8string result;
    const bool success = append_as_text(result, literal);
    EXPECT_TRUE(success);
    return result;
}

TEST(Literal, kind_names)
{
    EXPECT_EQ(literal_kind_name(Literal_Kind::boolean), u8"bool"sv);
    EXPECT_EQ(literal_kind_name(Literal_Kind::string), u8"str"sv);
    EXPECT_EQ(literal_kind_name(Literal_Kind::integer), u8"int"sv);
    EXPECT_EQ(literal_kind_name(Literal_Kind::floating), u8"float"sv);
    EXPECT_EQ(literal_kind_name(Literal_Kind::array), u8"array"sv);
}

TEST(Literal, kinds)
{
    EXPECT_TRUE(Literal::boolean(true).is_bool());
    EXPECT_TRUE(Literal::string(u8"x").is_string());
    EXPECT_TRUE(Literal::integer(1).is_int());
    EXPECT_TRUE(Literal::floating(1).is_float());
    EXPECT_TRUE(Literal::array({}).is_array());

    EXPECT_EQ(Literal::floating(1).get_kind(), Literal_Kind::floating);
    EXPECT_FALSE(Literal::floating(1).is_int());
}

TEST(Literal, equality)
{
    EXPECT_EQ(Literal::integer(1), Literal::integer(1));
    EXPECT_NE(Literal::integer(1), Literal::integer(2));
    EXPECT_NE(Literal::integer(1), Literal::floating(1));
    EXPECT_NE(Literal::boolean(false), Literal::integer(0));
    EXPECT_EQ(Literal::string(u8"abc"), Literal::string(u8"abc"));
    EXPECT_NE(Literal::string(u8"1"), Literal::integer(1));
}

TEST(Literal, array_equality)
{
    Literal::Array a;
    a.push_back(Literal::integer(1));
    a.push_back(Literal::string(u8"x"));
    Literal::Array b = a;
    Literal::Array c = a;
    c.push_back(Literal::boolean(true));

    EXPECT_EQ(Literal::array(std::move(a)), Literal::array(std::move(b)));
    EXPECT_NE(Literal::array({}), Literal::array(std::move(c)));
}

TEST(Literal, append_as_text)
{
    EXPECT_EQ(to_text(Literal::boolean(true)), u8"true"sv);
    EXPECT_EQ(to_text(Literal::boolean(false)), u8"false"sv);
    EXPECT_EQ(to_text(Literal::string(u8"a \"b\"")), u8"a \"b\""sv);
    EXPECT_EQ(to_text(Literal::integer(-12)), u8"-12"sv);
    EXPECT_EQ(to_text(Literal::integer(std::numeric_limits<Integer>::max())),
              u8"9223372036854775807"sv);
    EXPECT_EQ(to_text(Literal::floating(0.5)), u8"0.5"sv);
    EXPECT_EQ(to_text(Literal::floating(2)), u8"2.0"sv);
}

TEST(Literal, append_as_text_array_fails)
{
    std::pmr::u8string out = u8"unchanged";
    EXPECT_FALSE(append_as_text(out, Literal::array({})));
    EXPECT_EQ(out, u8"unchanged"sv);
}

} // namespace
} // namespace tern
