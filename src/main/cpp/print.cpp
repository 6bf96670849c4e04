#include <algorithm>
#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "tern/util/assert.hpp"
#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"
#include "tern/util/strings.hpp"
#include "tern/util/to_chars.hpp"

#include "tern/ast.hpp"
#include "tern/diagnostic.hpp"
#include "tern/literal.hpp"
#include "tern/print.hpp"

namespace tern {

namespace {

void do_print_affected_line(
    std::pmr::u8string& out,
    std::u8string_view source,
    std::size_t begin,
    std::size_t length,
    std::size_t line,
    std::size_t column
)
{
    TERN_ASSERT(length > 0);

    const std::u8string_view cited_code = find_line(source, begin);

    std::pmr::u8string line_chars { out.get_allocator() };
    append_integer(line_chars, line + 1);
    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length
        = pad_max - std::min(line_chars.length(), std::size_t { pad_max - 1 });
    out.append(pad_length, u8' ');
    out += line_chars;
    out += u8" | ";
    out += cited_code;
    out += u8'\n';

    const std::size_t align_length = std::max(pad_max, line_chars.length() + 1);
    out.append(align_length, u8' ');
    out += u8" | ";
    out.append(column, u8' ');

    const std::size_t indicator_length
        = std::min(length, std::max(cited_code.length(), column + 1) - column);
    out += u8'^';
    if (indicator_length) {
        out.append(indicator_length - 1, u8'~');
    }
    out += u8'\n';
}

void print_quoted(std::pmr::u8string& out, std::u8string_view str)
{
    out += u8'"';
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        default: out += c; break;
        }
    }
    out += u8'"';
}

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    TERN_ASSERT(index <= source.size());
    if (source.empty()) {
        return source;
    }

    if (index == source.size() || (source[index] == '\n' && index != 0)) {
        // Special case for EOF positions, which may be past the end of a line,
        // and even past the end of the whole source, but only by a single character.
        // For such positions, we yield the currently ended line.
        --index;
    }

    std::size_t begin = index == 0 ? std::u8string_view::npos : source.rfind('\n', index - 1);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find('\n', index), source.size());

    return source.substr(begin, end - begin);
}

void print_affected_line(std::pmr::u8string& out, std::u8string_view source, const Source_Span& pos)
{
    TERN_ASSERT(!pos.empty());
    do_print_affected_line(out, source, pos.begin, pos.length, pos.line, pos.column);
}

void print_diagnostic(std::pmr::u8string& out, std::u8string_view source, const Diagnostic& diagnostic)
{
    append_integer(out, diagnostic.location.line + 1);
    out += u8':';
    append_integer(out, diagnostic.location.column + 1);
    out += u8": ";
    out += severity_tag(diagnostic.severity);
    out += u8": ";
    out += diagnostic.message;
    out += u8" [";
    out += diagnostic.id;
    out += u8"]\n";
    if (!diagnostic.location.empty()) {
        print_affected_line(out, source, diagnostic.location);
    }
}

void print_literal(std::pmr::u8string& out, const Literal& literal)
{
    switch (literal.get_kind()) {
    case Literal_Kind::boolean: {
        out += literal.as_boolean() ? u8"Bool(true)" : u8"Bool(false)";
        return;
    }
    case Literal_Kind::string: {
        out += u8"Str(";
        print_quoted(out, literal.as_string());
        out += u8')';
        return;
    }
    case Literal_Kind::integer: {
        out += u8"Int(";
        append_integer(out, literal.as_integer());
        out += u8')';
        return;
    }
    case Literal_Kind::floating: {
        out += u8"Float(";
        append_float(out, literal.as_float());
        out += u8')';
        return;
    }
    case Literal_Kind::array: {
        out += u8"Array([";
        bool first = true;
        for (const Literal& element : literal.as_array()) {
            if (!first) {
                out += u8", ";
            }
            first = false;
            print_literal(out, element);
        }
        out += u8"])";
        return;
    }
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid literal kind.");
}

void print_ast(std::pmr::u8string& out, std::span<const ast::Node> nodes)
{
    for (const ast::Node& node : nodes) {
        if (const auto* const text = node.try_as_text()) {
            out += u8"Text(";
            print_quoted(out, text->get_source());
            out += u8")\n";
            continue;
        }
        const ast::Call& call = node.as_call();
        out += u8"Call(";
        out += call.get_name();
        out += u8", [";
        bool first = true;
        for (const ast::Argument& arg : call.get_arguments()) {
            if (!first) {
                out += u8", ";
            }
            first = false;
            out += arg.get_name();
            out += u8'=';
            print_literal(out, arg.get_value());
        }
        out += u8"])\n";
    }
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

} // namespace tern
