#ifndef TERN_EVALUATION_HPP
#define TERN_EVALUATION_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tern/util/result.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"

namespace tern {

enum struct Evaluation_Error_Kind : Default_Underlying {
    /// @brief The registry has no handler for the name of a call.
    unknown_directive,
    /// @brief The handler of a call reported an error.
    directive_failed,
};

[[nodiscard]]
std::u8string_view evaluation_error_kind_name(Evaluation_Error_Kind kind);

struct Evaluation_Error {
    Evaluation_Error_Kind kind;
    /// @brief The name of the directive that failed.
    std::u8string_view name;
    /// @brief The location of the failed call.
    Source_Span location;
    /// @brief For `directive_failed`, the error reported by the handler.
    std::optional<Handler_Error> cause;
    /// @brief For `unknown_directive`, the most similar name known to the registry,
    /// if any is similar enough to be a plausible correction.
    std::u8string_view suggestion;

    [[nodiscard]]
    friend bool operator==(const Evaluation_Error&, const Evaluation_Error&)
        = default;
};

/// @brief Evaluates a single call and appends its expansion to `out`.
/// If the call cannot be evaluated, the error is reported to the logger.
/// Then, if the context has an `Error_Fallback`, its output is appended instead and
/// the result is successful.
/// Otherwise, the error is returned.
/// In any case, partial output of a failed handler is removed from `out`.
[[nodiscard]]
Result<void, Evaluation_Error>
evaluate_call(std::pmr::u8string& out, const ast::Call& call, Context& context);

/// @brief Evaluates a sequence of nodes and appends the result to `out`.
/// Text is appended verbatim, and calls are evaluated via `evaluate_call`.
/// If any call fails (and there is no fallback), evaluation stops,
/// `out` is restored to its original size, and the error is returned.
[[nodiscard]]
Result<void, Evaluation_Error>
evaluate(std::pmr::u8string& out, std::span<const ast::Node> nodes, Context& context);

/// @brief Parses `source` and evaluates the resulting document.
/// Any `{{` which does not begin a well-formed call is reported as a debug diagnostic.
[[nodiscard]]
Result<void, Evaluation_Error>
render(std::pmr::u8string& out, std::u8string_view source, Context& context);

} // namespace tern

#endif
