#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/diagnostic.hpp"
#include "tern/evaluation.hpp"
#include "tern/literal.hpp"
#include "tern/parse.hpp"
#include "tern/print.hpp"

namespace tern {
namespace {

using namespace std::string_view_literals;

TEST(Print, find_line)
{
    constexpr std::u8string_view source = u8"first\nsecond\n\nfourth";
    EXPECT_EQ(find_line(source, 0), u8"first"sv);
    EXPECT_EQ(find_line(source, 3), u8"first"sv);
    EXPECT_EQ(find_line(source, 5), u8"first"sv);
    EXPECT_EQ(find_line(source, 6), u8"second"sv);
    EXPECT_EQ(find_line(source, 15), u8"fourth"sv);
    EXPECT_EQ(find_line(source, source.size()), u8"fourth"sv);
    EXPECT_EQ(find_line(u8""sv, 0), u8""sv);
}

TEST(Print, print_affected_line)
{
    constexpr std::u8string_view source = u8"a\nb {{ x() }}\n";
    std::pmr::u8string out;
    print_affected_line(out, source, Source_Span { { 1, 2, 4 }, 9 });

    constexpr std::u8string_view expected = u8"     2 | b {{ x() }}\n"
                                            u8"       |   ^~~~~~~~\n";
    EXPECT_EQ(out, expected);
}

TEST(Print, print_diagnostic)
{
    constexpr std::u8string_view source = u8"{{ nope() }}";
    const Diagnostic diagnostic {
        .severity = Severity::error,
        .id = u8"directive-lookup.unresolved",
        .location = Source_Span { { 0, 3, 3 }, 4 },
        .message = u8"No directive with the name \"nope\" exists.",
    };
    std::pmr::u8string out;
    print_diagnostic(out, source, diagnostic);

    constexpr std::u8string_view expected
        = u8"1:4: ERROR: No directive with the name \"nope\" exists. [directive-lookup.unresolved]\n"
          u8"     1 | {{ nope() }}\n"
          u8"       |    ^~~~\n";
    EXPECT_EQ(out, expected);
}

TEST(Print, print_diagnostic_without_location)
{
    const Diagnostic diagnostic {
        .severity = Severity::warning,
        .id = u8"deferred.mismatch",
        .location = {},
        .message = u8"Mismatch.",
    };
    std::pmr::u8string out;
    print_diagnostic(out, u8"", diagnostic);
    EXPECT_EQ(out, u8"1:1: WARNING: Mismatch. [deferred.mismatch]\n"sv);
}

TEST(Print, print_literal)
{
    Literal::Array elements;
    elements.push_back(Literal::string(u8"a\"b\n"));
    elements.push_back(Literal::boolean(true));
    elements.push_back(Literal::floating(-0.25));

    std::pmr::u8string out;
    print_literal(out, Literal::array(std::move(elements)));
    EXPECT_EQ(out, u8R"(Array([Str("a\"b\n"), Bool(true), Float(-0.25)]))"sv);
}

TEST(Print, print_ast)
{
    std::pmr::monotonic_buffer_resource memory;
    ast::Document document { &memory };
    parse_and_build(document, u8"Hello {{ name(x=1, y=\"a\") }}!\n"sv, &memory);

    std::pmr::u8string out { &memory };
    print_ast(out, document);

    constexpr std::u8string_view expected = u8"Text(\"Hello \")\n"
                                            u8"Call(name, [x=Int(1), y=Str(\"a\")])\n"
                                            u8"Text(\"!\\n\")\n";
    EXPECT_EQ(out, expected);
}

TEST(Print, printing_logger)
{
    constexpr std::u8string_view source = u8"{{ upper(text='a', text='b') }}\n{{ nope() }}";

    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string log { &memory };
    Printing_Logger logger { log, source };
    Builtin_Handler_Set builtins;
    Context context { builtins, logger, &memory, &memory, { .fallback = &empty_fallback } };

    std::pmr::u8string out { &memory };
    ASSERT_TRUE(render(out, source, context));
    EXPECT_EQ(out, u8"B\n"sv);

    constexpr std::u8string_view expected
        = u8"1:20: WARNING: Argument \"text\" was provided more than once in a call to \"upper\". "
          u8"Only the last occurrence is used. [duplicate.args]\n"
          u8"     1 | {{ upper(text='a', text='b') }}\n"
          u8"       |                    ^~~~\n"
          u8"2:4: ERROR: No directive with the name \"nope\" exists. Did you mean \"join\"? "
          u8"[directive-lookup.unresolved]\n"
          u8"     2 | {{ nope() }}\n"
          u8"       |    ^~~~\n";
    EXPECT_EQ(log, expected);
}

} // namespace
} // namespace tern
