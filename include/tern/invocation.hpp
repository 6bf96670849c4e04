#ifndef TERN_INVOCATION_HPP
#define TERN_INVOCATION_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "tern/util/result.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"
#include "tern/literal.hpp"

namespace tern {

struct Invocation {
    /// @brief The name which names the invoked directive.
    std::u8string_view name;
    /// @brief The call responsible for the invocation.
    const ast::Call& call;
    /// @brief The arguments with which the directive is invoked, in source order.
    /// Names are not necessarily unique.
    std::span<const ast::Argument> arguments;

    [[nodiscard]]
    Source_Span get_source_span() const
    {
        return call.get_source_span();
    }

    /// @brief Returns the argument named `name`, or `nullptr` if there is none.
    /// If the name occurs multiple times, the last occurrence is returned.
    [[nodiscard]]
    const ast::Argument* find_argument(std::u8string_view argument_name) const;
};

/// @brief Creates a new `Invocation` object from a call.
[[nodiscard]]
inline Invocation make_invocation(const ast::Call& c)
{
    return {
        .name = c.get_name(),
        .call = c,
        .arguments = c.get_arguments(),
    };
}

/// @brief Appends the names which occur more than once in `arguments` to `out`,
/// each of them only once, in the order of their second occurrence.
void find_duplicate_argument_names(
    std::pmr::vector<std::u8string_view>& out,
    std::span<const ast::Argument> arguments
);

// ARGUMENT MATCHING ===========================================================

/// @brief Returns the value of the argument named `name`,
/// or a `missing_argument` error if there is none.
[[nodiscard]]
Result<const Literal*, Handler_Error>
expect_argument(const Invocation& call, std::u8string_view name, Context& context);

[[nodiscard]]
Result<bool, Handler_Error>
get_bool_argument(const Invocation& call, std::u8string_view name, Context& context);

[[nodiscard]]
Result<std::u8string_view, Handler_Error>
get_string_argument(const Invocation& call, std::u8string_view name, Context& context);

[[nodiscard]]
Result<Integer, Handler_Error>
get_integer_argument(const Invocation& call, std::u8string_view name, Context& context);

/// @brief Like `get_integer_argument`, but additionally fails with `invalid_value`
/// if the value is negative.
[[nodiscard]]
Result<Integer, Handler_Error>
get_non_negative_integer_argument(const Invocation& call, std::u8string_view name, Context& context);

/// @brief Returns the value of a `float` argument.
/// Integer arguments are accepted as well and converted.
[[nodiscard]]
Result<Float, Handler_Error>
get_float_argument(const Invocation& call, std::u8string_view name, Context& context);

[[nodiscard]]
Result<const Literal::Array*, Handler_Error>
get_array_argument(const Invocation& call, std::u8string_view name, Context& context);

/// @brief Like `get_string_argument`, but returns `fallback` if the argument is absent.
/// Arguments of the wrong kind are still an error.
[[nodiscard]]
Result<std::u8string_view, Handler_Error> get_string_argument_or(
    const Invocation& call,
    std::u8string_view name,
    std::u8string_view fallback,
    Context& context
);

/// @brief Creates a `type_mismatch` error for the argument `name`,
/// stating that `expected` was expected, but `actual` was given.
[[nodiscard]]
Handler_Error make_type_mismatch_error(
    std::u8string_view name,
    std::u8string_view expected,
    Literal_Kind actual,
    Context& context
);

} // namespace tern

#endif
