#ifndef TERN_PARSE_HPP
#define TERN_PARSE_HPP

#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "tern/util/function_ref.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/fwd.hpp"

namespace tern {

enum struct AST_Instruction_Type : Default_Underlying {
    /// @brief Ignore the next `n` characters.
    /// This is used only within directive calls,
    /// where whitespace between tokens doesn't matter.
    skip,
    /// @brief The next `n` characters are literal text.
    text,
    /// @brief Begins the document.
    /// Always the first instruction.
    /// The operand is the amount of nodes (text runs and calls) in the document.
    push_document,
    /// @brief Ends the document.
    /// Always the last instruction.
    pop_document,
    /// @brief Begin call.
    /// The operand is the amount of arguments.
    ///
    /// Advance past `{{`.
    push_call,
    /// @brief Advance past `}}`.
    pop_call,
    /// @brief The next `n` characters are the directive name.
    call_name,
    /// @brief Advance past `(`.
    push_arguments,
    /// @brief Advance past `)`.
    pop_arguments,
    /// @brief Begin argument.
    /// Always followed by `argument_name`, `argument_equal`, and a literal.
    push_argument,
    pop_argument,
    /// @brief The next `n` characters are an argument name.
    argument_name,
    /// @brief Advance past `=` following an argument name.
    argument_equal,
    /// @brief Advance past `,` between arguments.
    argument_comma,
    /// @brief The next `n` characters are `true`.
    keyword_true,
    /// @brief The next `n` characters are `false`.
    keyword_false,
    /// @brief The next `n` characters are a string literal, including both delimiters.
    string_literal,
    /// @brief The next `n` characters are a decimal integer literal.
    int_literal,
    /// @brief The next `n` characters are a decimal floating-point literal.
    float_literal,
    /// @brief Begin array.
    /// The operand is the amount of elements.
    ///
    /// Advance past `[`.
    push_array,
    /// @brief Advance past `]`.
    pop_array,
    /// @brief Advance past `,` between array elements, or past a trailing `,`.
    array_comma,
};

[[nodiscard]]
constexpr bool ast_instruction_type_has_operand(AST_Instruction_Type type)
{
    using enum AST_Instruction_Type;
    switch (type) {
    case pop_document:
    case pop_call:
    case push_arguments:
    case pop_arguments:
    case push_argument:
    case pop_argument:
    case argument_equal:
    case argument_comma:
    case pop_array:
    case array_comma: return false;
    default: return true;
    }
}

[[nodiscard]]
constexpr bool ast_instruction_type_is_literal(AST_Instruction_Type type)
{
    using enum AST_Instruction_Type;
    switch (type) {
    case keyword_true:
    case keyword_false:
    case string_literal:
    case int_literal:
    case float_literal:
    case push_array: return true;
    default: return false;
    }
}

[[nodiscard]]
std::u8string_view ast_instruction_type_name(AST_Instruction_Type type);

struct AST_Instruction {
    AST_Instruction_Type type;
    std::size_t n = 0;

    friend std::strong_ordering operator<=>(const AST_Instruction&, const AST_Instruction&)
        = default;
};

/// @brief Invoked with the span of a `{{` opener
/// whenever an attempted call at that opener could not be matched,
/// and the opener was treated as text instead.
using Degradation_Consumer = Function_Ref<void(const Source_Span& opener)>;

/// @brief Parses a document.
/// This process does not result in an AST, but a vector of instructions that can be used to
/// construct an AST.
///
/// Parsing cannot fail.
/// Anything which is not a well-formed call, including malformed calls,
/// is parsed as text.
/// @param out A vector where instructions for constructing a syntax tree are emitted.
/// @param source The source code to parse.
/// @param on_degraded If not empty, invoked whenever a `{{` does not begin a call.
void parse(
    std::pmr::vector<AST_Instruction>& out,
    std::u8string_view source,
    Degradation_Consumer on_degraded = {}
);

/// @brief Builds an AST from a span of instructions,
/// usually obtained from `parse`.
void build_ast(
    ast::Document& out,
    std::u8string_view source,
    std::span<const AST_Instruction> instructions,
    std::pmr::memory_resource* memory
);

/// @brief Builds an AST from a span of instructions,
/// usually obtained from `parse`.
[[nodiscard]]
ast::Document build_ast(
    std::u8string_view source,
    std::span<const AST_Instruction> instructions,
    std::pmr::memory_resource* memory
);

/// @brief Parses a document via `parse(out, source, on_degraded)`,
/// and runs `build_ast` on the resulting parse instructions.
void parse_and_build(
    ast::Document& out,
    std::u8string_view source,
    std::pmr::memory_resource* memory,
    Degradation_Consumer on_degraded = {}
);

} // namespace tern

#endif
