#ifndef TERN_DEFERRED_EXPANSION_HPP
#define TERN_DEFERRED_EXPANSION_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tern/util/result.hpp"

#include "tern/ast.hpp"
#include "tern/evaluation.hpp"
#include "tern/fwd.hpp"
#include "tern/settings.hpp"

namespace tern {

enum struct Deferred_Error_Kind : Default_Underlying {
    /// @brief The amount of placeholders in the staged text differs from the amount of calls.
    placeholder_mismatch,
    /// @brief One of the calls failed to evaluate.
    evaluation_failed,
};

struct Deferred_Error {
    Deferred_Error_Kind kind;
    /// @brief The amount of calls which were deferred.
    std::size_t expected_placeholders;
    /// @brief The amount of placeholders found in the staged text.
    std::size_t actual_placeholders;
    /// @brief For `evaluation_failed`, the error of the failed call.
    std::optional<Evaluation_Error> cause;

    [[nodiscard]]
    friend bool operator==(const Deferred_Error&, const Deferred_Error&)
        = default;
};

/// @brief Writes the text of `nodes` to `out`, with every call replaced by `placeholder`,
/// and appends the replaced calls to `calls`, in order.
/// The resulting text can be processed by another renderer,
/// such as a Markdown renderer,
/// before the calls are expanded via `expand_deferred`.
///
/// `placeholder` shall not be empty.
void defer_calls(
    std::pmr::u8string& out,
    std::pmr::vector<const ast::Call*>& calls,
    std::span<const ast::Node> nodes,
    std::u8string_view placeholder = default_placeholder
);

/// @brief Replaces the `i`-th occurrence of `placeholder` in `staged_text` with the expansion of
/// `calls[i]`, and appends the result to `out`.
/// If the amount of placeholders does not equal `calls.size()`,
/// nothing is appended, a `deferred.mismatch` error is logged, and an error is returned.
/// If a call fails to evaluate and the context has no fallback,
/// `out` is restored to its original size and an error is returned.
[[nodiscard]]
Result<void, Deferred_Error> expand_deferred(
    std::pmr::u8string& out,
    std::u8string_view staged_text,
    std::span<const ast::Call* const> calls,
    std::u8string_view placeholder,
    Context& context
);

} // namespace tern

#endif
