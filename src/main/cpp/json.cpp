#include <cmath>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "tern/util/assert.hpp"
#include "tern/util/to_chars.hpp"

#include "tern/ast.hpp"
#include "tern/json.hpp"
#include "tern/literal.hpp"

namespace tern::json {
namespace {

[[nodiscard]]
std::u8string_view escape_sequence(char8_t c)
{
    switch (c) {
    case u8'"': return u8"\\\"";
    case u8'\\': return u8"\\\\";
    case u8'\b': return u8"\\b";
    case u8'\f': return u8"\\f";
    case u8'\n': return u8"\\n";
    case u8'\r': return u8"\\r";
    case u8'\t': return u8"\\t";
    default: return {};
    }
}

void append_unicode_escape(std::pmr::u8string& out, char8_t c)
{
    constexpr std::u8string_view hex_digits = u8"0123456789abcdef";
    out += u8"\\u00";
    out += hex_digits[(c >> 4) & 0xf];
    out += hex_digits[c & 0xf];
}

[[nodiscard]]
bool is_overridden(std::span<const ast::Argument> arguments, std::size_t index)
{
    const std::u8string_view name = arguments[index].get_name();
    for (std::size_t i = index + 1; i < arguments.size(); ++i) {
        if (arguments[i].get_name() == name) {
            return true;
        }
    }
    return false;
}

} // namespace

void append_string(std::pmr::u8string& out, std::u8string_view str)
{
    out += u8'"';
    std::size_t plain_begin = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        const char8_t c = str[i];
        const std::u8string_view escape = escape_sequence(c);
        if (escape.empty() && c >= 0x20) {
            continue;
        }
        out += str.substr(plain_begin, i - plain_begin);
        if (escape.empty()) {
            append_unicode_escape(out, c);
        }
        else {
            out += escape;
        }
        plain_begin = i + 1;
    }
    out += str.substr(plain_begin);
    out += u8'"';
}

void append_literal(std::pmr::u8string& out, const Literal& literal)
{
    switch (literal.get_kind()) {
    case Literal_Kind::boolean: {
        out += literal.as_boolean() ? u8"true" : u8"false";
        return;
    }
    case Literal_Kind::string: {
        append_string(out, literal.as_string());
        return;
    }
    case Literal_Kind::integer: {
        append_integer(out, literal.as_integer());
        return;
    }
    case Literal_Kind::floating: {
        const Float value = literal.as_float();
        if (!std::isfinite(value)) {
            out += u8"null";
            return;
        }
        append_float(out, value);
        return;
    }
    case Literal_Kind::array: {
        out += u8'[';
        bool first = true;
        for (const Literal& element : literal.as_array()) {
            if (!first) {
                out += u8',';
            }
            first = false;
            append_literal(out, element);
        }
        out += u8']';
        return;
    }
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid literal kind.");
}

void append_arguments(std::pmr::u8string& out, std::span<const ast::Argument> arguments)
{
    out += u8'{';
    bool first = true;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (is_overridden(arguments, i)) {
            continue;
        }
        if (!first) {
            out += u8',';
        }
        first = false;
        append_string(out, arguments[i].get_name());
        out += u8':';
        append_literal(out, arguments[i].get_value());
    }
    out += u8'}';
}

} // namespace tern::json
