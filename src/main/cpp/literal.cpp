#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/assert.hpp"
#include "tern/util/to_chars.hpp"

#include "tern/fwd.hpp"
#include "tern/literal.hpp"

namespace tern {

std::u8string_view literal_kind_name(Literal_Kind kind)
{
    switch (kind) {
    case Literal_Kind::boolean: return u8"bool";
    case Literal_Kind::string: return u8"str";
    case Literal_Kind::integer: return u8"int";
    case Literal_Kind::floating: return u8"float";
    case Literal_Kind::array: return u8"array";
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid literal kind.");
}

bool append_as_text(std::pmr::u8string& out, const Literal& literal)
{
    switch (literal.get_kind()) {
    case Literal_Kind::boolean: {
        out += literal.as_boolean() ? u8"true" : u8"false";
        return true;
    }
    case Literal_Kind::string: {
        out += literal.as_string();
        return true;
    }
    case Literal_Kind::integer: {
        append_integer(out, literal.as_integer());
        return true;
    }
    case Literal_Kind::floating: {
        append_float(out, literal.as_float());
        return true;
    }
    case Literal_Kind::array: {
        return false;
    }
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid literal kind.");
}

} // namespace tern
