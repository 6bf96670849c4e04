#ifndef TERN_AST_HPP
#define TERN_AST_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/source_position.hpp"

#include "tern/fwd.hpp"
#include "tern/literal.hpp"

namespace tern::ast {

/// @brief A non-empty run of document characters which are not part of any call.
struct Text final {
private:
    Source_Span m_source_span;
    std::u8string_view m_source;

public:
    [[nodiscard]]
    Text(const Source_Span& source_span, std::u8string_view source);

    [[nodiscard]]
    Source_Span get_source_span() const
    {
        return m_source_span;
    }

    [[nodiscard]]
    std::u8string_view get_source() const
    {
        return m_source;
    }

    [[nodiscard]]
    friend bool operator==(const Text&, const Text&)
        = default;
};

/// @brief A named argument of a call, such as `x = 1`.
struct Argument final {
private:
    Source_Span m_source_span;
    std::u8string_view m_source;
    std::u8string_view m_name;
    Source_Span m_value_span;
    Literal m_value;

public:
    /// @brief Constructs an argument.
    /// @param source_span The span from the start of the name to the end of the value.
    /// @param source The source code within `source_span`.
    /// @param name The name of the argument.
    /// @param value_span The span of the literal value.
    /// @param value The value.
    [[nodiscard]]
    Argument(
        const Source_Span& source_span,
        std::u8string_view source,
        std::u8string_view name,
        const Source_Span& value_span,
        Literal&& value
    );

    [[nodiscard]]
    Source_Span get_source_span() const
    {
        return m_source_span;
    }

    [[nodiscard]]
    std::u8string_view get_source() const
    {
        return m_source;
    }

    [[nodiscard]]
    Source_Span get_name_span() const
    {
        return m_source_span.with_length(m_name.length());
    }

    [[nodiscard]]
    std::u8string_view get_name() const
    {
        return m_name;
    }

    [[nodiscard]]
    Source_Span get_value_span() const
    {
        return m_value_span;
    }

    [[nodiscard]]
    const Literal& get_value() const
    {
        return m_value;
    }
};

/// @brief A directive call, such as `{{ name(x = 1) }}`.
struct Call final {
private:
    Source_Span m_source_span;
    std::u8string_view m_source;
    Source_Span m_name_span;
    std::u8string_view m_name;
    std::pmr::vector<Argument> m_arguments;

public:
    /// @brief Constructs a call.
    /// @param source_span The span from the opening `{{` up to and including the closing `}}`.
    /// @param source The source code within `source_span`.
    /// @param name_span The span of the directive name.
    /// @param name The directive name.
    /// @param arguments The arguments, in source order.
    [[nodiscard]]
    Call(
        const Source_Span& source_span,
        std::u8string_view source,
        const Source_Span& name_span,
        std::u8string_view name,
        std::pmr::vector<Argument>&& arguments
    );

    [[nodiscard]]
    Source_Span get_source_span() const
    {
        return m_source_span;
    }

    /// @brief Returns the source code of this call,
    /// including the surrounding braces.
    [[nodiscard]]
    std::u8string_view get_source() const
    {
        return m_source;
    }

    [[nodiscard]]
    Source_Span get_name_span() const
    {
        return m_name_span;
    }

    [[nodiscard]]
    std::u8string_view get_name() const
    {
        return m_name;
    }

    [[nodiscard]]
    std::span<const Argument> get_arguments() const
    {
        return m_arguments;
    }
};

using Node_Variant = std::variant<Text, Call>;

struct Node : Node_Variant {
    using Node_Variant::variant;

    [[nodiscard]]
    bool is_text() const
    {
        return std::holds_alternative<Text>(*this);
    }
    [[nodiscard]]
    bool is_call() const
    {
        return std::holds_alternative<Call>(*this);
    }

    [[nodiscard]]
    const Text& as_text() const
    {
        return std::get<Text>(*this);
    }
    [[nodiscard]]
    const Text* try_as_text() const
    {
        return std::get_if<Text>(this);
    }

    [[nodiscard]]
    const Call& as_call() const
    {
        return std::get<Call>(*this);
    }
    [[nodiscard]]
    const Call* try_as_call() const
    {
        return std::get_if<Call>(this);
    }

    [[nodiscard]]
    Source_Span get_source_span() const
    {
        return std::visit([&](const auto& v) -> Source_Span { return v.get_source_span(); }, *this);
    }

    [[nodiscard]]
    std::u8string_view get_source() const
    {
        return std::visit(
            [&](const auto& v) -> std::u8string_view { return v.get_source(); }, *this
        );
    }
};

/// @brief The result of parsing a whole document.
/// The source spans of the nodes tile the document without gaps or overlap.
using Document = std::pmr::vector<Node>;

} // namespace tern::ast

#endif
