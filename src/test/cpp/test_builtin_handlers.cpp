#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "tern/util/result.hpp"

#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/directive_handler.hpp"
#include "tern/evaluation.hpp"

#include "collecting_logger.hpp"

namespace tern {
namespace {

using namespace std::string_view_literals;

struct Builtin_Handler_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Builtin_Handler_Set builtins;
    Context context { builtins, logger, &memory, &memory };

    std::pmr::u8string out { &memory };

    /// @brief Renders `source` and expects success.
    [[nodiscard]]
    std::u8string_view expand(std::u8string_view source)
    {
        out.clear();
        const Result<void, Evaluation_Error> result = render(out, source, context);
        EXPECT_TRUE(result);
        return out;
    }

    /// @brief Renders `source`, which shall consist of a single failing call,
    /// and returns the error of the handler.
    [[nodiscard]]
    Handler_Error expect_failure(std::u8string_view source)
    {
        out.clear();
        Result<void, Evaluation_Error> result = render(out, source, context);
        EXPECT_FALSE(result);
        if (result) {
            return { Handler_Error_Kind::other, {} };
        }
        EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::directive_failed);
        EXPECT_TRUE(result.error().cause);
        if (!result.error().cause) {
            return { Handler_Error_Kind::other, {} };
        }
        return std::move(*result.error().cause);
    }
};

TEST_F(Builtin_Handler_Test, lookup)
{
    for (const std::u8string_view name :
         { u8"join"sv, u8"json"sv, u8"lower"sv, u8"regex_replace"sv, u8"repeat"sv, u8"upper"sv }) {
        EXPECT_NE(builtins(name), nullptr);
    }
    EXPECT_EQ(builtins(u8""sv), nullptr);
    EXPECT_EQ(builtins(u8"Upper"sv), nullptr);
    EXPECT_EQ(builtins(u8"zzz"sv), nullptr);
    EXPECT_NE(builtins(u8"upper"sv), builtins(u8"lower"sv));
}

TEST_F(Builtin_Handler_Test, fuzzy_lookup_name)
{
    const Distant<std::u8string_view> repat = builtins.fuzzy_lookup_name(u8"repat"sv, context);
    ASSERT_TRUE(repat);
    EXPECT_EQ(repat.value, u8"repeat"sv);
    EXPECT_EQ(repat.distance, 1);

    const Distant<std::u8string_view> exact = builtins.fuzzy_lookup_name(u8"json"sv, context);
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact.value, u8"json"sv);
    EXPECT_EQ(exact.distance, 0);
}

TEST_F(Builtin_Handler_Test, upper_lower)
{
    EXPECT_EQ(expand(u8"{{ upper(text='Hello, World!') }}"sv), u8"HELLO, WORLD!"sv);
    EXPECT_EQ(expand(u8"{{ lower(text='Hello, World!') }}"sv), u8"hello, world!"sv);
    EXPECT_EQ(expand(u8"{{ upper(text='') }}"sv), u8""sv);
    EXPECT_EQ(expand(u8"{{ upper(text=\"grüße\") }}"sv), u8"GRüßE"sv);
}

TEST_F(Builtin_Handler_Test, upper_wrong_type)
{
    const Handler_Error error = expect_failure(u8"{{ upper(text=[1]) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::type_mismatch);
    EXPECT_EQ(error.message, u8"Argument \"text\" has to be of type str, but is of type array."sv);
}

TEST_F(Builtin_Handler_Test, repeat)
{
    EXPECT_EQ(expand(u8"{{ repeat(text='ab', times=3) }}"sv), u8"ababab"sv);
    EXPECT_EQ(expand(u8"{{ repeat(text='ab', times=0) }}"sv), u8""sv);
    EXPECT_EQ(expand(u8"{{ repeat(times=1, text=`x`) }}"sv), u8"x"sv);
    EXPECT_EQ(expand(u8"{{ repeat(text='', times=9223372036854775807) }}"sv), u8""sv);
}

TEST_F(Builtin_Handler_Test, repeat_negative)
{
    const Handler_Error error = expect_failure(u8"{{ repeat(text='a', times=-1) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::invalid_value);
    EXPECT_EQ(error.message, u8"Argument \"times\" must not be negative."sv);
}

TEST_F(Builtin_Handler_Test, repeat_too_long)
{
    const Handler_Error error
        = expect_failure(u8"{{ repeat(text='abc', times=9223372036854775807) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::invalid_value);
}

TEST_F(Builtin_Handler_Test, repeat_float_times)
{
    const Handler_Error error = expect_failure(u8"{{ repeat(text='a', times=1.0) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::type_mismatch);
    EXPECT_EQ(error.message, u8"Argument \"times\" has to be of type int, but is of type float."sv);
}

TEST_F(Builtin_Handler_Test, join)
{
    EXPECT_EQ(expand(u8"{{ join(items=[]) }}"sv), u8""sv);
    EXPECT_EQ(expand(u8"{{ join(items=['a', 'b', 'c']) }}"sv), u8"abc"sv);
    EXPECT_EQ(
        expand(u8"{{ join(items=[1, -2.5, true, 'x',], separator=' | ') }}"sv),
        u8"1 | -2.5 | true | x"sv
    );
}

TEST_F(Builtin_Handler_Test, join_nested_array)
{
    const Handler_Error error = expect_failure(u8"{{ join(items=[1, [2]]) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::type_mismatch);
    EXPECT_EQ(
        error.message,
        u8"Elements of argument \"items\" have to be of type bool, str, int, or float, "
        u8"but an element is of type array."sv
    );
}

TEST_F(Builtin_Handler_Test, join_missing_items)
{
    const Handler_Error error = expect_failure(u8"{{ join(separator=',') }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::missing_argument);
    EXPECT_EQ(error.message, u8"Missing argument \"items\"."sv);
}

TEST_F(Builtin_Handler_Test, join_wrong_separator)
{
    const Handler_Error error = expect_failure(u8"{{ join(items=[], separator=0) }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::type_mismatch);
}

TEST_F(Builtin_Handler_Test, regex_replace)
{
    EXPECT_EQ(
        expand(u8R"x({{ regex_replace(text="2024-05-01", pattern="(\d+)-(\d+)-(\d+)", replacement="$3.$2.$1") }})x"sv),
        u8"01.05.2024"sv
    );
    EXPECT_EQ(
        expand(u8"{{ regex_replace(text='no match', pattern='x', replacement='y') }}"sv),
        u8"no match"sv
    );
}

TEST_F(Builtin_Handler_Test, regex_replace_bad_pattern)
{
    const Handler_Error error
        = expect_failure(u8"{{ regex_replace(text='a', pattern='(', replacement='') }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::invalid_value);
    EXPECT_EQ(error.message, u8"The pattern \"(\" is not a valid regular expression."sv);
}

TEST_F(Builtin_Handler_Test, regex_replace_missing_replacement)
{
    const Handler_Error error = expect_failure(u8"{{ regex_replace(text='a', pattern='a') }}"sv);
    EXPECT_EQ(error.kind, Handler_Error_Kind::missing_argument);
    EXPECT_EQ(error.message, u8"Missing argument \"replacement\"."sv);
}

TEST_F(Builtin_Handler_Test, json)
{
    EXPECT_EQ(expand(u8"{{ json() }}"sv), u8"{}"sv);
    EXPECT_EQ(
        expand(u8"{{ json(title='A \"quoted\" title', draft=false, tags=['x', 1]) }}"sv),
        u8R"({"title":"A \"quoted\" title","draft":false,"tags":["x",1]})"sv
    );
}

TEST(Directive_Handler, error_kind_names)
{
    EXPECT_EQ(handler_error_kind_name(Handler_Error_Kind::missing_argument), u8"missing_argument"sv);
    EXPECT_EQ(handler_error_kind_name(Handler_Error_Kind::type_mismatch), u8"type_mismatch"sv);
    EXPECT_EQ(handler_error_kind_name(Handler_Error_Kind::invalid_value), u8"invalid_value"sv);
    EXPECT_EQ(handler_error_kind_name(Handler_Error_Kind::other), u8"other"sv);
}

} // namespace
} // namespace tern
