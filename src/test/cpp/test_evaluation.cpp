#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "tern/util/result.hpp"
#include "tern/util/severity.hpp"

#include "tern/ast.hpp"
#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/diagnostic.hpp"
#include "tern/directive_handler.hpp"
#include "tern/evaluation.hpp"
#include "tern/handler_map.hpp"
#include "tern/invocation.hpp"
#include "tern/parse.hpp"

#include "collecting_logger.hpp"

namespace tern {
namespace {

using namespace std::string_view_literals;

/// @brief Writes some output, and then fails anyway.
struct Failing_Handler final : Directive_Handler {
    [[nodiscard]]
    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation&, Context& context) const final
    {
        out += u8"partial";
        return Handler_Error { Handler_Error_Kind::other,
                               std::pmr::u8string { u8"Broken.", context.get_memory() } };
    }
};

constexpr Failing_Handler failing_handler {};

struct Evaluation_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Builtin_Handler_Set builtins;
    Handler_Map registry { &memory, &builtins };
    Context context { registry, logger, &memory, &memory };

    std::pmr::u8string out { &memory };

    Evaluation_Test()
    {
        registry.insert_or_assign(u8"broken"sv, failing_handler);
    }

    [[nodiscard]]
    Result<void, Evaluation_Error> render_source(std::u8string_view source)
    {
        return render(out, source, context);
    }

    void set_fallback(const Error_Fallback* fallback)
    {
        context.set_options({ .fallback = fallback, .warn_duplicate_arguments = true });
    }
};

TEST_F(Evaluation_Test, empty)
{
    ASSERT_TRUE(render_source(u8""sv));
    EXPECT_EQ(out, u8""sv);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Evaluation_Test, text_is_verbatim)
{
    constexpr std::u8string_view source = u8"Hello, world!\n  {not a call} }}";
    ASSERT_TRUE(render_source(source));
    EXPECT_EQ(out, source);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Evaluation_Test, upper)
{
    ASSERT_TRUE(render_source(u8R"({{ upper(text="hi") }})"sv));
    EXPECT_EQ(out, u8"HI"sv);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Evaluation_Test, call_between_text)
{
    ASSERT_TRUE(render_source(u8"Hello {{ upper(text='world') }}!"sv));
    EXPECT_EQ(out, u8"Hello WORLD!"sv);
}

TEST_F(Evaluation_Test, appends_to_existing_output)
{
    out = u8"prefix:";
    ASSERT_TRUE(render_source(u8"{{ lower(text='AB') }}"sv));
    EXPECT_EQ(out, u8"prefix:ab"sv);
}

TEST_F(Evaluation_Test, unknown_directive)
{
    constexpr std::u8string_view source = u8"a {{ zzzzzzzzzzzzzzzzzzzzzz() }} b";
    const Result<void, Evaluation_Error> result = render_source(source);
    ASSERT_FALSE(result);

    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::unknown_directive);
    EXPECT_EQ(result.error().name, u8"zzzzzzzzzzzzzzzzzzzzzz"sv);
    EXPECT_EQ(result.error().location, (Source_Span { { 0, 5, 5 }, 22 }));
    EXPECT_FALSE(result.error().cause);
    EXPECT_EQ(result.error().suggestion, u8""sv);

    EXPECT_EQ(out, u8""sv);
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::directive_lookup_unresolved);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::error);
    EXPECT_EQ(
        logger.diagnostics[0].message,
        u8"No directive with the name \"zzzzzzzzzzzzzzzzzzzzzz\" exists."sv
    );
}

TEST_F(Evaluation_Test, unknown_directive_suggestion)
{
    const Result<void, Evaluation_Error> result = render_source(u8"{{ uper(text='a') }}"sv);
    ASSERT_FALSE(result);

    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::unknown_directive);
    EXPECT_EQ(result.error().suggestion, u8"upper"sv);
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(
        logger.diagnostics[0].message,
        u8"No directive with the name \"uper\" exists. Did you mean \"upper\"?"sv
    );
}

TEST_F(Evaluation_Test, missing_is_unknown_directive)
{
    const Result<void, Evaluation_Error> result = render_source(u8"{{ missing() }}"sv);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::unknown_directive);
    EXPECT_EQ(result.error().name, u8"missing"sv);
    EXPECT_TRUE(logger.was_logged(diagnostic::directive_lookup_unresolved));
}

TEST_F(Evaluation_Test, directive_failed)
{
    constexpr std::u8string_view source = u8"x {{ repeat(text='a', times=-1) }}";
    const Result<void, Evaluation_Error> result = render_source(source);
    ASSERT_FALSE(result);

    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::directive_failed);
    EXPECT_EQ(result.error().name, u8"repeat"sv);
    EXPECT_EQ(result.error().location, (Source_Span { { 0, 2, 2 }, 32 }));
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->kind, Handler_Error_Kind::invalid_value);
    EXPECT_EQ(result.error().cause->message, u8"Argument \"times\" must not be negative."sv);

    EXPECT_EQ(out, u8""sv);
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::directive_failed);
    EXPECT_EQ(
        logger.diagnostics[0].message,
        u8"Directive \"repeat\" failed (invalid_value): Argument \"times\" must not be negative."sv
    );
}

TEST_F(Evaluation_Test, missing_argument)
{
    const Result<void, Evaluation_Error> result = render_source(u8"{{ upper() }}"sv);
    ASSERT_FALSE(result);
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->kind, Handler_Error_Kind::missing_argument);
    EXPECT_EQ(result.error().cause->message, u8"Missing argument \"text\"."sv);
}

TEST_F(Evaluation_Test, type_mismatch)
{
    const Result<void, Evaluation_Error> result = render_source(u8"{{ upper(text=1) }}"sv);
    ASSERT_FALSE(result);
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->kind, Handler_Error_Kind::type_mismatch);
    EXPECT_EQ(
        result.error().cause->message,
        u8"Argument \"text\" has to be of type str, but is of type int."sv
    );
}

TEST_F(Evaluation_Test, failure_restores_output)
{
    out = u8"kept";
    const Result<void, Evaluation_Error> result
        = render_source(u8"a{{ upper(text='b') }}{{ broken() }}c"sv);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::directive_failed);
    EXPECT_EQ(out, u8"kept"sv);
}

TEST_F(Evaluation_Test, failed_handler_partial_output_is_discarded)
{
    const ast::Call* call = nullptr;
    ast::Document document { &memory };
    parse_and_build(document, u8"{{ broken() }}"sv, &memory);
    ASSERT_EQ(document.size(), 1);
    call = &document[0].as_call();

    out = u8"before";
    const Result<void, Evaluation_Error> result = evaluate_call(out, *call, context);
    ASSERT_FALSE(result);
    EXPECT_EQ(out, u8"before"sv);
}

TEST_F(Evaluation_Test, source_fallback)
{
    set_fallback(&source_fallback);

    constexpr std::u8string_view source = u8"a{{ broken() }}b{{ nope(x=1) }}c{{ upper(text='d') }}";
    ASSERT_TRUE(render_source(source));
    EXPECT_EQ(out, u8"a{{ broken() }}b{{ nope(x=1) }}cD"sv);

    EXPECT_EQ(logger.count_logged(diagnostic::directive_failed), 1);
    EXPECT_EQ(logger.count_logged(diagnostic::directive_lookup_unresolved), 1);
}

TEST_F(Evaluation_Test, empty_fallback)
{
    set_fallback(&empty_fallback);

    ASSERT_TRUE(render_source(u8"a{{ broken() }}b{{ nope() }}c"sv));
    EXPECT_EQ(out, u8"abc"sv);
    EXPECT_EQ(logger.diagnostics.size(), 2);
}

TEST_F(Evaluation_Test, duplicate_arguments_last_wins)
{
    constexpr std::u8string_view source = u8"{{ upper(text='a', text='b') }}";
    ASSERT_TRUE(render_source(source));
    EXPECT_EQ(out, u8"B"sv);

    ASSERT_EQ(logger.diagnostics.size(), 1);
    const Collected_Diagnostic& warning = logger.diagnostics[0];
    EXPECT_EQ(warning.id, diagnostic::duplicate_args);
    EXPECT_EQ(warning.severity, Severity::warning);
    EXPECT_EQ(warning.location, (Source_Span { { 0, 19, 19 }, 4 }));
    EXPECT_EQ(
        warning.message,
        u8"Argument \"text\" was provided more than once in a call to \"upper\". "
        u8"Only the last occurrence is used."sv
    );
}

TEST_F(Evaluation_Test, duplicate_arguments_warned_once_per_name)
{
    ASSERT_TRUE(render_source(u8"{{ json(a=1, a=2, a=3, b=1, b=2) }}"sv));
    EXPECT_EQ(out, u8R"({"a":3,"b":2})"sv);
    EXPECT_EQ(logger.count_logged(diagnostic::duplicate_args), 2);
}

TEST_F(Evaluation_Test, duplicate_arguments_warning_disabled)
{
    context.set_options({ .fallback = nullptr, .warn_duplicate_arguments = false });

    ASSERT_TRUE(render_source(u8"{{ upper(text='a', text='b') }}"sv));
    EXPECT_EQ(out, u8"B"sv);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Evaluation_Test, deterministic)
{
    constexpr std::u8string_view source
        = u8"{{ repeat(text='ab', times=3) }}-{{ join(items=[1, 2.5, true], separator=',') }}";

    ASSERT_TRUE(render_source(source));
    const std::pmr::u8string first = out;
    out.clear();
    ASSERT_TRUE(render_source(source));

    EXPECT_EQ(first, u8"ababab-1,2.5,true"sv);
    EXPECT_EQ(out, first);
}

TEST_F(Evaluation_Test, degraded_call_is_text)
{
    constexpr std::u8string_view source = u8"{{ upper(text=01) }}";
    ASSERT_TRUE(render_source(source));
    EXPECT_EQ(out, source);

    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::shortcode_degraded);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::debug);
    EXPECT_EQ(logger.diagnostics[0].location, (Source_Span { { 0, 0, 0 }, 2 }));
}

TEST_F(Evaluation_Test, degraded_call_not_logged_above_debug)
{
    logger.set_min_severity(Severity::warning);

    ASSERT_TRUE(render_source(u8"{{ upper(text=01) }}"sv));
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Evaluation_Test, errors_not_logged_when_logger_is_silent)
{
    logger.set_min_severity(Severity::none);

    const Result<void, Evaluation_Error> result = render_source(u8"{{ missing() }}"sv);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, Evaluation_Error_Kind::unknown_directive);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST(Evaluation, error_kind_names)
{
    EXPECT_EQ(
        evaluation_error_kind_name(Evaluation_Error_Kind::unknown_directive),
        u8"unknown_directive"sv
    );
    EXPECT_EQ(
        evaluation_error_kind_name(Evaluation_Error_Kind::directive_failed), u8"directive_failed"sv
    );
}

} // namespace
} // namespace tern
