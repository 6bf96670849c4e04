#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/result.hpp"
#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"
#include "tern/util/strings.hpp"
#include "tern/util/to_chars.hpp"

#include "tern/ast.hpp"
#include "tern/context.hpp"
#include "tern/deferred_expansion.hpp"
#include "tern/diagnostic.hpp"
#include "tern/evaluation.hpp"
#include "tern/fwd.hpp"

using namespace std::string_view_literals;

namespace tern {

void defer_calls(
    std::pmr::u8string& out,
    std::pmr::vector<const ast::Call*>& calls,
    std::span<const ast::Node> nodes,
    std::u8string_view placeholder
)
{
    TERN_ASSERT(!placeholder.empty());

    for (const ast::Node& node : nodes) {
        if (const auto* const call = node.try_as_call()) {
            out += placeholder;
            calls.push_back(call);
        }
        else {
            out += node.as_text().get_source();
        }
    }
}

Result<void, Deferred_Error> expand_deferred(
    std::pmr::u8string& out,
    std::u8string_view staged_text,
    std::span<const ast::Call* const> calls,
    std::u8string_view placeholder,
    Context& context
)
{
    TERN_ASSERT(!placeholder.empty());

    const std::size_t placeholder_count = count_occurrences(staged_text, placeholder);
    if (placeholder_count != calls.size()) {
        if (context.emits(Severity::error)) {
            std::pmr::u8string message { context.get_transient_memory() };
            message += u8"Expected "sv;
            append_integer(message, calls.size());
            message += u8" placeholders for deferred calls, but found "sv;
            append_integer(message, placeholder_count);
            message += u8"."sv;
            // The staged text is not the document source, so there is no line to cite.
            context.try_error(diagnostic::deferred_mismatch, Source_Span {}, message);
        }
        return Deferred_Error {
            .kind = Deferred_Error_Kind::placeholder_mismatch,
            .expected_placeholders = calls.size(),
            .actual_placeholders = placeholder_count,
            .cause = std::nullopt,
        };
    }

    const std::size_t initial_size = out.size();
    std::size_t pos = 0;
    for (const ast::Call* const call : calls) {
        TERN_ASSERT(call);
        const std::size_t next = staged_text.find(placeholder, pos);
        TERN_ASSERT(next != std::u8string_view::npos);
        out += staged_text.substr(pos, next - pos);

        Result<void, Evaluation_Error> result = evaluate_call(out, *call, context);
        if (!result) {
            out.resize(initial_size);
            return Deferred_Error {
                .kind = Deferred_Error_Kind::evaluation_failed,
                .expected_placeholders = calls.size(),
                .actual_placeholders = placeholder_count,
                .cause = std::move(result).error(),
            };
        }
        pos = next + placeholder.length();
    }
    out += staged_text.substr(pos);

    return {};
}

} // namespace tern
