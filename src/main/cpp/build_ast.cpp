#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/fwd.hpp"
#include "tern/lex.hpp"
#include "tern/literal.hpp"
#include "tern/parse.hpp"
#include "tern/settings.hpp"

using namespace std::string_view_literals;

namespace tern {
namespace ast {

Text::Text(const Source_Span& source_span, std::u8string_view source)
    : m_source_span { source_span }
    , m_source { source }
{
    TERN_ASSERT(!source.empty());
    TERN_ASSERT(source_span.length == source.length());
}

Argument::Argument(
    const Source_Span& source_span,
    std::u8string_view source,
    std::u8string_view name,
    const Source_Span& value_span,
    Literal&& value
)
    : m_source_span { source_span }
    , m_source { source }
    , m_name { name }
    , m_value_span { value_span }
    , m_value { std::move(value) }
{
    TERN_ASSERT(source_span.length == source.length());
    TERN_ASSERT(source.starts_with(name));
    TERN_ASSERT(value_span.end() == source_span.end());
}

Call::Call(
    const Source_Span& source_span,
    std::u8string_view source,
    const Source_Span& name_span,
    std::u8string_view name,
    std::pmr::vector<Argument>&& arguments
)
    : m_source_span { source_span }
    , m_source { source }
    , m_name_span { name_span }
    , m_name { name }
    , m_arguments { std::move(arguments) }
{
    TERN_ASSERT(source_span.length == source.length());
    TERN_ASSERT(source.starts_with(u8"{{"));
    TERN_ASSERT(source.ends_with(u8"}}"));
    TERN_ASSERT(!name.empty());
    TERN_ASSERT(name_span.length == name.length());
}

} // namespace ast

namespace {

struct [[nodiscard]] AST_Builder {
private:
    const std::u8string_view m_source;
    const std::span<const AST_Instruction> m_instructions;
    std::pmr::memory_resource* const m_memory;

    std::size_t m_index = 0;
    Source_Position m_pos {};

public:
    AST_Builder(
        std::u8string_view source,
        std::span<const AST_Instruction> instructions,
        std::pmr::memory_resource* memory
    )
        : m_source { source }
        , m_instructions { instructions }
        , m_memory { memory }
    {
        TERN_ASSERT(!instructions.empty());
    }

    void build_document(ast::Document& out)
    {
        const AST_Instruction push_doc = pop();
        TERN_ASSERT(push_doc.type == AST_Instruction_Type::push_document);
        out.clear();
        out.reserve(push_doc.n);

        for (std::size_t i = 0; i < push_doc.n; ++i) {
            append_node(out);
        }

        const AST_Instruction pop_doc = pop();
        TERN_ASSERT(pop_doc.type == AST_Instruction_Type::pop_document);
        TERN_ASSERT(m_pos.begin == m_source.length());
    }

private:
    [[nodiscard]]
    std::u8string_view extract(const Source_Span& span) const
    {
        return m_source.substr(span.begin, span.length);
    }

    void advance_by(std::size_t n)
    {
        TERN_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_index == m_instructions.size();
    }

    [[nodiscard]]
    AST_Instruction peek()
    {
        TERN_ASSERT(m_index < m_instructions.size());
        return m_instructions[m_index];
    }

    AST_Instruction pop()
    {
        TERN_ASSERT(m_index < m_instructions.size());
        return m_instructions[m_index++];
    }

    /// @brief Pops an instruction of the given type without operand,
    /// and advances past the single character `c` that it stands for.
    void pop_punctuation(AST_Instruction_Type type, [[maybe_unused]] char8_t c)
    {
        const AST_Instruction instruction = pop();
        TERN_ASSERT(instruction.type == type);
        TERN_DEBUG_ASSERT(m_source[m_pos.begin] == c);
        advance_by(1);
    }

    void ignore_skips()
    {
        while (!eof() && peek().type == AST_Instruction_Type::skip) {
            advance_by(pop().n);
        }
    }

    void append_node(ast::Document& out)
    {
        const AST_Instruction instruction = peek();
        switch (instruction.type) {
            using enum AST_Instruction_Type;
        case text: {
            pop();
            const Source_Span span { m_pos, instruction.n };
            out.emplace_back(ast::Text { span, extract(span) });
            advance_by(instruction.n);
            break;
        }
        case push_call: {
            out.emplace_back(build_call());
            break;
        }
        default: TERN_ASSERT_UNREACHABLE(u8"Invalid document node instruction.");
        }
    }

    [[nodiscard]]
    ast::Call build_call()
    {
        const AST_Instruction instruction = pop();
        TERN_ASSERT(instruction.type == AST_Instruction_Type::push_call);
        TERN_DEBUG_ASSERT(extract(Source_Span { m_pos, 2 }) == u8"{{"sv);

        const Source_Position initial_pos = m_pos;
        advance_by(2);
        ignore_skips();

        const AST_Instruction name_instruction = pop();
        TERN_ASSERT(name_instruction.type == AST_Instruction_Type::call_name);
        const Source_Span name_span { m_pos, name_instruction.n };
        advance_by(name_instruction.n);
        ignore_skips();

        pop_punctuation(AST_Instruction_Type::push_arguments, u8'(');

        std::pmr::vector<ast::Argument> arguments { m_memory };
        arguments.reserve(instruction.n);

        while (true) {
            const AST_Instruction next = peek();
            if (next.type == AST_Instruction_Type::skip) {
                advance_by(next.n);
                pop();
                continue;
            }
            if (next.type == AST_Instruction_Type::argument_comma) {
                pop_punctuation(AST_Instruction_Type::argument_comma, u8',');
                continue;
            }
            if (next.type == AST_Instruction_Type::pop_arguments) {
                pop_punctuation(AST_Instruction_Type::pop_arguments, u8')');
                break;
            }
            arguments.push_back(build_argument());
        }
        TERN_ASSERT(arguments.size() == instruction.n);

        ignore_skips();
        const AST_Instruction pop_instruction = pop();
        TERN_ASSERT(pop_instruction.type == AST_Instruction_Type::pop_call);
        TERN_DEBUG_ASSERT(extract(Source_Span { m_pos, 2 }) == u8"}}"sv);
        advance_by(2);

        const Source_Span source_span { initial_pos, m_pos.begin - initial_pos.begin };
        return { source_span, extract(source_span), name_span, extract(name_span),
                 std::move(arguments) };
    }

    [[nodiscard]]
    ast::Argument build_argument()
    {
        const AST_Instruction push_instruction = pop();
        TERN_ASSERT(push_instruction.type == AST_Instruction_Type::push_argument);

        const Source_Position initial_pos = m_pos;
        const AST_Instruction name_instruction = pop();
        TERN_ASSERT(name_instruction.type == AST_Instruction_Type::argument_name);
        const Source_Span name_span { m_pos, name_instruction.n };
        advance_by(name_instruction.n);
        ignore_skips();

        pop_punctuation(AST_Instruction_Type::argument_equal, u8'=');
        ignore_skips();

        const Source_Position value_pos = m_pos;
        Literal value = build_literal();
        const Source_Span value_span { value_pos, m_pos.begin - value_pos.begin };

        const AST_Instruction pop_instruction = pop();
        TERN_ASSERT(pop_instruction.type == AST_Instruction_Type::pop_argument);

        const Source_Span source_span { initial_pos, m_pos.begin - initial_pos.begin };
        return { source_span, extract(source_span), extract(name_span), value_span,
                 std::move(value) };
    }

    [[nodiscard]]
    Literal build_literal()
    {
        const AST_Instruction instruction = peek();
        switch (instruction.type) {
            using enum AST_Instruction_Type;
        case keyword_true:
        case keyword_false: {
            pop();
            advance_by(instruction.n);
            return Literal::boolean(instruction.type == keyword_true);
        }
        case string_literal: {
            pop();
            const std::u8string_view literal = extract(Source_Span { m_pos, instruction.n });
            advance_by(instruction.n);
            return Literal::string(string_literal_content(literal));
        }
        case int_literal: {
            pop();
            const std::u8string_view literal = extract(Source_Span { m_pos, instruction.n });
            advance_by(instruction.n);
            const std::optional<Integer> value = parse_integer_literal(literal);
            // The parser only emits integer literals whose value is representable.
            TERN_ASSERT(value);
            return Literal::integer(*value);
        }
        case float_literal: {
            pop();
            const std::u8string_view literal = extract(Source_Span { m_pos, instruction.n });
            advance_by(instruction.n);
            const std::optional<Float> value = parse_float_literal(literal);
            TERN_ASSERT(value);
            return Literal::floating(*value);
        }
        case push_array: {
            return build_array();
        }
        default: TERN_ASSERT_UNREACHABLE(u8"Invalid literal instruction.");
        }
    }

    [[nodiscard]]
    Literal build_array()
    {
        const AST_Instruction instruction = peek();
        pop_punctuation(AST_Instruction_Type::push_array, u8'[');

        Literal::Array elements { m_memory };
        elements.reserve(instruction.n);

        while (true) {
            const AST_Instruction next = peek();
            if (next.type == AST_Instruction_Type::skip) {
                advance_by(next.n);
                pop();
                continue;
            }
            if (next.type == AST_Instruction_Type::array_comma) {
                pop_punctuation(AST_Instruction_Type::array_comma, u8',');
                continue;
            }
            if (next.type == AST_Instruction_Type::pop_array) {
                pop_punctuation(AST_Instruction_Type::pop_array, u8']');
                break;
            }
            elements.push_back(build_literal());
        }
        TERN_ASSERT(elements.size() == instruction.n);

        return Literal::array(std::move(elements));
    }
};

} // namespace

void build_ast(
    ast::Document& out,
    std::u8string_view source,
    std::span<const AST_Instruction> instructions,
    std::pmr::memory_resource* memory
)
{
    AST_Builder { source, instructions, memory }.build_document(out);
}

ast::Document build_ast(
    std::u8string_view source,
    std::span<const AST_Instruction> instructions,
    std::pmr::memory_resource* memory
)
{
    ast::Document result { memory };
    build_ast(result, source, instructions, memory);
    return result;
}

void parse_and_build(
    ast::Document& out,
    std::u8string_view source,
    std::pmr::memory_resource* memory,
    Degradation_Consumer on_degraded
)
{
    std::pmr::vector<AST_Instruction> instructions { memory };
    instructions.reserve(2 + (source.length() / 1024 + 1) * instructions_per_kilobyte);
    parse(instructions, source, on_degraded);
    build_ast(out, source, instructions, memory);
}

} // namespace tern
