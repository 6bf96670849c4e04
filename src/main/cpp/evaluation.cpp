#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/result.hpp"
#include "tern/util/severity.hpp"
#include "tern/util/typo.hpp"

#include "tern/ast.hpp"
#include "tern/context.hpp"
#include "tern/diagnostic.hpp"
#include "tern/directive_handler.hpp"
#include "tern/evaluation.hpp"
#include "tern/fwd.hpp"
#include "tern/invocation.hpp"
#include "tern/parse.hpp"

using namespace std::string_view_literals;

namespace tern {

std::u8string_view evaluation_error_kind_name(Evaluation_Error_Kind kind)
{
    using enum Evaluation_Error_Kind;
    switch (kind) {
        TERN_ENUM_STRING_CASE8(unknown_directive);
        TERN_ENUM_STRING_CASE8(directive_failed);
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid kind.");
}

namespace {

void try_warn_duplicate_arguments(const Invocation& call, Context& context)
{
    if (!context.emits(Severity::warning)) {
        return;
    }

    std::pmr::vector<std::u8string_view> duplicates { context.get_transient_memory() };
    find_duplicate_argument_names(duplicates, call.arguments);

    std::pmr::u8string message { context.get_transient_memory() };
    for (const std::u8string_view name : duplicates) {
        message.clear();
        message += u8"Argument \""sv;
        message += name;
        message += u8"\" was provided more than once in a call to \""sv;
        message += call.name;
        message += u8"\". Only the last occurrence is used."sv;

        const ast::Argument* const last = call.find_argument(name);
        TERN_ASSERT(last);
        context.try_warning(diagnostic::duplicate_args, last->get_name_span(), message);
    }
}

[[nodiscard]]
std::u8string_view find_suggestion(std::u8string_view name, Context& context)
{
    const Distant<std::u8string_view> closest
        = context.get_registry().fuzzy_lookup_name(name, context);
    if (!closest || !is_plausible_typo(closest.distance, name.length())) {
        return {};
    }
    return closest.value;
}

void try_log_error(const Evaluation_Error& error, Context& context)
{
    if (!context.emits(Severity::error)) {
        return;
    }

    std::pmr::u8string message { context.get_transient_memory() };
    switch (error.kind) {
    case Evaluation_Error_Kind::unknown_directive: {
        message += u8"No directive with the name \""sv;
        message += error.name;
        message += u8"\" exists."sv;
        if (!error.suggestion.empty()) {
            message += u8" Did you mean \""sv;
            message += error.suggestion;
            message += u8"\"?"sv;
        }
        context.try_error(diagnostic::directive_lookup_unresolved, error.location, message);
        return;
    }
    case Evaluation_Error_Kind::directive_failed: {
        TERN_ASSERT(error.cause);
        message += u8"Directive \""sv;
        message += error.name;
        message += u8"\" failed ("sv;
        message += handler_error_kind_name(error.cause->kind);
        message += u8"): "sv;
        message += error.cause->message;
        context.try_error(diagnostic::directive_failed, error.location, message);
        return;
    }
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid kind.");
}

[[nodiscard]]
Result<void, Evaluation_Error> handle_error(
    std::pmr::u8string& out,
    const ast::Call& call,
    Evaluation_Error&& error,
    Context& context
)
{
    try_log_error(error, context);
    if (const Error_Fallback* const fallback = context.get_options().fallback) {
        (*fallback)(out, call, error, context);
        return {};
    }
    return std::move(error);
}

} // namespace

Result<void, Evaluation_Error>
evaluate_call(std::pmr::u8string& out, const ast::Call& call, Context& context)
{
    const Invocation invocation = make_invocation(call);
    if (context.get_options().warn_duplicate_arguments) {
        try_warn_duplicate_arguments(invocation, context);
    }

    const Directive_Handler* const handler = context.get_registry()(invocation.name);
    if (!handler) {
        Evaluation_Error error {
            .kind = Evaluation_Error_Kind::unknown_directive,
            .name = invocation.name,
            .location = call.get_name_span(),
            .cause = std::nullopt,
            .suggestion = find_suggestion(invocation.name, context),
        };
        return handle_error(out, call, std::move(error), context);
    }

    const std::size_t initial_size = out.size();
    Result<void, Handler_Error> result = (*handler)(out, invocation, context);
    if (!result) {
        out.resize(initial_size);
        Evaluation_Error error {
            .kind = Evaluation_Error_Kind::directive_failed,
            .name = invocation.name,
            .location = call.get_source_span(),
            .cause = std::move(result).error(),
            .suggestion = {},
        };
        return handle_error(out, call, std::move(error), context);
    }
    return {};
}

Result<void, Evaluation_Error>
evaluate(std::pmr::u8string& out, std::span<const ast::Node> nodes, Context& context)
{
    const std::size_t initial_size = out.size();
    for (const ast::Node& node : nodes) {
        if (const auto* const text = node.try_as_text()) {
            out += text->get_source();
            continue;
        }
        Result<void, Evaluation_Error> result = evaluate_call(out, node.as_call(), context);
        if (!result) {
            out.resize(initial_size);
            return result;
        }
    }
    return {};
}

Result<void, Evaluation_Error>
render(std::pmr::u8string& out, std::u8string_view source, Context& context)
{
    const auto on_degraded = [&](const Source_Span& opener) {
        context.try_debug(
            diagnostic::shortcode_degraded, opener,
            u8"This \"{{\" does not begin a well-formed call and is treated as text."sv
        );
    };

    ast::Document document { context.get_transient_memory() };
    parse_and_build(document, source, context.get_transient_memory(), on_degraded);
    return evaluate(out, document, context);
}

} // namespace tern
