#ifndef TERN_DIRECTIVE_HANDLER_HPP
#define TERN_DIRECTIVE_HANDLER_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/result.hpp"
#include "tern/util/typo.hpp"

#include "tern/fwd.hpp"

namespace tern {

enum struct Handler_Error_Kind : Default_Underlying {
    /// @brief A required argument was not provided.
    missing_argument,
    /// @brief An argument was provided, but with a literal of the wrong kind.
    type_mismatch,
    /// @brief An argument has the right kind, but its value is not acceptable,
    /// such as a negative repetition count.
    invalid_value,
    /// @brief Anything else.
    other,
};

[[nodiscard]]
std::u8string_view handler_error_kind_name(Handler_Error_Kind kind);

/// @brief The reason why a `Directive_Handler` failed.
struct Handler_Error {
    Handler_Error_Kind kind;
    /// @brief A human-readable description of the problem.
    std::pmr::u8string message;

    [[nodiscard]]
    friend bool operator==(const Handler_Error&, const Handler_Error&)
        = default;
};

/// @brief Implements the behavior of one or multiple directives.
/// Handlers receive the arguments exactly as they appear in the call,
/// so validating presence and kinds of arguments is up to the handler.
struct Directive_Handler {
    /// @brief Appends the expansion of the directive to `out`.
    /// On failure, the contents of `out` past its original size are discarded by the caller,
    /// so there is no need to clean up partial output.
    [[nodiscard]]
    virtual Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const
        = 0;
};

/// @brief Maps directive names onto handlers.
/// The registry is owned by the embedder and has to outlive any evaluation using it.
struct Function_Registry {
    /// @brief Returns the closest known name to `name`,
    /// or a falsy result if no name is known at all.
    [[nodiscard]]
    virtual Distant<std::u8string_view>
    fuzzy_lookup_name(std::u8string_view name, Context& context) const
        = 0;

    /// @brief Returns the handler for the directive named `name`,
    /// or `nullptr` if there is no such directive.
    [[nodiscard]]
    virtual const Directive_Handler* operator()(std::u8string_view name) const = 0;
};

} // namespace tern

#endif
