#include <cstddef>
#include <string_view>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/chars.hpp"
#include "tern/util/source_position.hpp"

#include "tern/fwd.hpp"
#include "tern/lex.hpp"
#include "tern/parse.hpp"
#include "tern/settings.hpp"

using namespace std::string_view_literals;

namespace tern {
namespace {

struct [[nodiscard]] Parser {
private:
    struct [[nodiscard]] Scoped_Attempt {
    private:
        Parser* m_self;
        const Source_Position m_initial_pos;
        const std::size_t m_initial_size;

    public:
        Scoped_Attempt(Parser& self)
            : m_self { &self }
            , m_initial_pos { self.m_pos }
            , m_initial_size { self.m_out.size() }
        {
        }

        Scoped_Attempt(const Scoped_Attempt&) = delete;
        Scoped_Attempt& operator=(const Scoped_Attempt&) = delete;

        void commit()
        {
            TERN_ASSERT(m_self);
            m_self = nullptr;
        }

        void abort()
        {
            TERN_ASSERT(m_self);
            TERN_ASSERT(m_self->m_out.size() >= m_initial_size);

            m_self->m_pos = m_initial_pos;
            m_self->m_out.resize(m_initial_size);

            m_self = nullptr;
        }

        ~Scoped_Attempt() // NOLINT(bugprone-exception-escape)
        {
            if (m_self) {
                abort();
            }
        }
    };

    std::pmr::vector<AST_Instruction>& m_out;
    const std::u8string_view m_source;
    const Degradation_Consumer m_on_degraded;

    Source_Position m_pos {};
    std::size_t m_array_depth = 0;

public:
    [[nodiscard]]
    Parser(
        std::pmr::vector<AST_Instruction>& out,
        std::u8string_view source,
        Degradation_Consumer on_degraded
    )
        : m_out { out }
        , m_source { source }
        , m_on_degraded { on_degraded }
    {
    }

    void operator()()
    {
        consume_document();
    }

private:
    void degrade(const Source_Span& opener)
    {
        if (m_on_degraded) {
            m_on_degraded(opener);
        }
    }

    void advance_by(std::size_t n)
    {
        TERN_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    Scoped_Attempt attempt()
    {
        return Scoped_Attempt { *this };
    }

    /// @brief Returns all remaining text, from the current parsing position to the end of the
    /// document.
    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        TERN_DEBUG_ASSERT(m_pos.begin <= m_source.size());
        return m_source.substr(m_pos.begin);
    }

    /// @return `true` if the parser is at the end of the document, `false` otherwise.
    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    /// @return `peek_all().starts_with(text)`.
    [[nodiscard]]
    bool peek(std::u8string_view text) const
    {
        return peek_all().starts_with(text);
    }

    /// @return `true` if the next character equals `c`, `false` otherwise.
    [[nodiscard]]
    bool peek(char8_t c) const
    {
        return !eof() && m_source[m_pos.begin] == c;
    }

    [[nodiscard]]
    bool expect(char8_t c)
    {
        if (!peek(c)) {
            return false;
        }
        advance_by(1);
        return true;
    }

    [[nodiscard]]
    bool expect(std::u8string_view text)
    {
        if (!peek(text)) {
            return false;
        }
        advance_by(text.size());
        return true;
    }

    void skip_whitespace()
    {
        if (const std::size_t length = match_whitespace(peek_all())) {
            m_out.push_back({ AST_Instruction_Type::skip, length });
            advance_by(length);
        }
    }

    void consume_document()
    {
        const std::size_t document_instruction_index = m_out.size();
        m_out.push_back({ AST_Instruction_Type::push_document, 0 });

        std::size_t node_count = 0;
        std::size_t text_length = 0;

        while (!eof()) {
            if (peek(u8"{{"sv)) {
                if (try_match_call(text_length)) {
                    node_count += text_length == 0 ? 1 : 2;
                    text_length = 0;
                    continue;
                }
                degrade(Source_Span { m_pos, 2 });
                // Only the first brace is consumed so that in "{{{ x() }}",
                // a call can still begin at the second brace.
                advance_by(1);
                ++text_length;
                continue;
            }
            const std::size_t next_opener = m_source.find(u8"{{"sv, m_pos.begin);
            const std::size_t length = next_opener == std::u8string_view::npos
                ? m_source.length() - m_pos.begin
                : next_opener - m_pos.begin;
            advance_by(length);
            text_length += length;
        }

        if (text_length != 0) {
            m_out.push_back({ AST_Instruction_Type::text, text_length });
            ++node_count;
        }

        m_out[document_instruction_index].n = node_count;
        m_out.push_back({ AST_Instruction_Type::pop_document });
    }

    /// @brief Attempts to match a call at the current position.
    /// If successful, emits a `text` instruction for the `preceding_text` characters that were
    /// consumed prior to the call, followed by the instructions for the call.
    /// Otherwise, has no effect.
    [[nodiscard]]
    bool try_match_call(std::size_t preceding_text)
    {
        Scoped_Attempt a = attempt();

        if (preceding_text != 0) {
            m_out.push_back({ AST_Instruction_Type::text, preceding_text });
        }
        if (!expect(u8"{{"sv)) {
            return false;
        }
        const std::size_t call_instruction_index = m_out.size();
        m_out.push_back({ AST_Instruction_Type::push_call, 0 });
        skip_whitespace();

        const std::size_t name_length = match_identifier(peek_all());
        if (name_length == 0) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::call_name, name_length });
        advance_by(name_length);
        skip_whitespace();

        if (!expect(u8'(')) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::push_arguments });
        skip_whitespace();

        std::size_t argument_count = 0;
        if (!peek(u8')')) {
            while (true) {
                if (!try_match_argument()) {
                    return false;
                }
                ++argument_count;
                skip_whitespace();
                // Unlike in arrays, a trailing comma is not permitted,
                // so every comma has to be followed by another argument.
                if (!expect(u8',')) {
                    break;
                }
                m_out.push_back({ AST_Instruction_Type::argument_comma });
                skip_whitespace();
            }
        }

        if (!expect(u8')')) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::pop_arguments });
        skip_whitespace();

        if (!expect(u8"}}"sv)) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::pop_call });
        m_out[call_instruction_index].n = argument_count;

        a.commit();
        return true;
    }

    /// @brief Matches an argument of the form `name = literal`.
    /// On failure, the instructions emitted so far are left in place;
    /// the caller is expected to abort its attempt.
    [[nodiscard]]
    bool try_match_argument()
    {
        const std::size_t name_length = match_identifier(peek_all());
        if (name_length == 0) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::push_argument });
        m_out.push_back({ AST_Instruction_Type::argument_name, name_length });
        advance_by(name_length);
        skip_whitespace();

        if (!expect(u8'=')) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::argument_equal });
        skip_whitespace();

        if (!try_match_literal()) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::pop_argument });
        return true;
    }

    /// @brief Matches a literal.
    /// The alternatives are tried in order,
    /// and the first one whose complete lexical form matches is taken.
    [[nodiscard]]
    bool try_match_literal()
    {
        return try_match_boolean() //
            || try_match_string() //
            || try_match_float() //
            || try_match_integer() //
            || try_match_array();
    }

    [[nodiscard]]
    bool try_match_boolean()
    {
        const Boolean_Result result = match_boolean(peek_all());
        if (!result) {
            return false;
        }
        const auto type
            = result.value ? AST_Instruction_Type::keyword_true : AST_Instruction_Type::keyword_false;
        m_out.push_back({ type, result.length });
        advance_by(result.length);
        return true;
    }

    [[nodiscard]]
    bool try_match_string()
    {
        const std::size_t length = match_string(peek_all());
        if (length == 0) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::string_literal, length });
        advance_by(length);
        return true;
    }

    [[nodiscard]]
    bool try_match_float()
    {
        const std::size_t length = match_float(peek_all());
        if (length == 0 || !parse_float_literal(peek_all().substr(0, length))) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::float_literal, length });
        advance_by(length);
        return true;
    }

    [[nodiscard]]
    bool try_match_integer()
    {
        const std::size_t length = match_integer(peek_all());
        if (length == 0 || !parse_integer_literal(peek_all().substr(0, length))) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::int_literal, length });
        advance_by(length);
        return true;
    }

    /// @brief Matches an array, unless arrays are already nested `max_array_depth` levels deep.
    [[nodiscard]]
    bool try_match_array()
    {
        if (m_array_depth >= max_array_depth || !peek(u8'[')) {
            return false;
        }
        ++m_array_depth;
        const bool result = try_match_array_elements();
        --m_array_depth;
        return result;
    }

    [[nodiscard]]
    bool try_match_array_elements()
    {
        Scoped_Attempt a = attempt();

        if (!expect(u8'[')) {
            return false;
        }
        const std::size_t array_instruction_index = m_out.size();
        m_out.push_back({ AST_Instruction_Type::push_array, 0 });
        skip_whitespace();

        std::size_t element_count = 0;
        while (!peek(u8']')) {
            if (!try_match_literal()) {
                return false;
            }
            ++element_count;
            skip_whitespace();
            if (!expect(u8',')) {
                break;
            }
            m_out.push_back({ AST_Instruction_Type::array_comma });
            skip_whitespace();
        }

        if (!expect(u8']')) {
            return false;
        }
        m_out.push_back({ AST_Instruction_Type::pop_array });
        m_out[array_instruction_index].n = element_count;

        a.commit();
        return true;
    }
};

} // namespace

std::u8string_view ast_instruction_type_name(AST_Instruction_Type type)
{
    using enum AST_Instruction_Type;
    switch (type) {
        TERN_ENUM_STRING_CASE8(skip);
        TERN_ENUM_STRING_CASE8(text);
        TERN_ENUM_STRING_CASE8(push_document);
        TERN_ENUM_STRING_CASE8(pop_document);
        TERN_ENUM_STRING_CASE8(push_call);
        TERN_ENUM_STRING_CASE8(pop_call);
        TERN_ENUM_STRING_CASE8(call_name);
        TERN_ENUM_STRING_CASE8(push_arguments);
        TERN_ENUM_STRING_CASE8(pop_arguments);
        TERN_ENUM_STRING_CASE8(push_argument);
        TERN_ENUM_STRING_CASE8(pop_argument);
        TERN_ENUM_STRING_CASE8(argument_name);
        TERN_ENUM_STRING_CASE8(argument_equal);
        TERN_ENUM_STRING_CASE8(argument_comma);
        TERN_ENUM_STRING_CASE8(keyword_true);
        TERN_ENUM_STRING_CASE8(keyword_false);
        TERN_ENUM_STRING_CASE8(string_literal);
        TERN_ENUM_STRING_CASE8(int_literal);
        TERN_ENUM_STRING_CASE8(float_literal);
        TERN_ENUM_STRING_CASE8(push_array);
        TERN_ENUM_STRING_CASE8(pop_array);
        TERN_ENUM_STRING_CASE8(array_comma);
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid type.");
}

void parse(
    std::pmr::vector<AST_Instruction>& out,
    std::u8string_view source,
    Degradation_Consumer on_degraded
)
{
    Parser { out, source, on_degraded }();
}

} // namespace tern
