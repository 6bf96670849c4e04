#ifndef TERN_BUILTIN_HANDLER_SET_HPP
#define TERN_BUILTIN_HANDLER_SET_HPP

#include <string>
#include <string_view>

#include "tern/util/result.hpp"
#include "tern/util/typo.hpp"

#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"

namespace tern {

enum struct Text_Transformation : bool {
    uppercase,
    lowercase,
};

/// @brief Handler for `upper(text)` and `lower(text)`.
/// Only ASCII letters are affected; other characters are left unchanged.
struct Case_Transform_Handler final : Directive_Handler {
private:
    Text_Transformation m_transform;

public:
    [[nodiscard]]
    constexpr explicit Case_Transform_Handler(Text_Transformation transform)
        : m_transform { transform }
    {
    }

    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const final;
};

/// @brief Handler for `repeat(text, times)`.
/// Appends `text` exactly `times` times, where `times` is a non-negative integer.
struct Repeat_Handler final : Directive_Handler {
    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const final;
};

/// @brief Handler for `join(items, separator = "")`.
/// Every element of `items` is converted to text and joined by `separator`.
/// Nested arrays cannot be converted to text and result in a type mismatch.
struct Join_Handler final : Directive_Handler {
    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const final;
};

/// @brief Handler for `regex_replace(text, pattern, replacement)`.
/// Replaces every match of the ECMAScript regular expression `pattern` in `text`
/// with `replacement`, which may refer to captures using `$1`, `$&`, etc.
struct Regex_Replace_Handler final : Directive_Handler {
    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const final;
};

/// @brief Handler for `json(...)`.
/// Writes all arguments as a JSON object.
struct JSON_Handler final : Directive_Handler {
    Result<void, Handler_Error>
    operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const final;
};

/// @brief The registry of directives which are available out of the box.
/// The set is immutable and can be shared between any number of evaluations.
struct Builtin_Handler_Set final : Function_Registry {
    [[nodiscard]]
    Distant<std::u8string_view>
    fuzzy_lookup_name(std::u8string_view name, Context& context) const final;

    [[nodiscard]]
    const Directive_Handler* operator()(std::u8string_view name) const final;
};

} // namespace tern

#endif
