#include <algorithm>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/result.hpp"

#include "tern/ast.hpp"
#include "tern/context.hpp"
#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"
#include "tern/invocation.hpp"
#include "tern/literal.hpp"

using namespace std::string_view_literals;

namespace tern {

std::u8string_view handler_error_kind_name(Handler_Error_Kind kind)
{
    using enum Handler_Error_Kind;
    switch (kind) {
        TERN_ENUM_STRING_CASE8(missing_argument);
        TERN_ENUM_STRING_CASE8(type_mismatch);
        TERN_ENUM_STRING_CASE8(invalid_value);
        TERN_ENUM_STRING_CASE8(other);
    }
    TERN_ASSERT_UNREACHABLE(u8"Invalid kind.");
}

const ast::Argument* Invocation::find_argument(std::u8string_view argument_name) const
{
    // The last occurrence wins.
    const auto it = std::ranges::find(
        arguments.rbegin(), arguments.rend(), argument_name, &ast::Argument::get_name
    );
    return it == arguments.rend() ? nullptr : &*it;
}

void find_duplicate_argument_names(
    std::pmr::vector<std::u8string_view>& out,
    std::span<const ast::Argument> arguments
)
{
    for (std::size_t i = 1; i < arguments.size(); ++i) {
        const std::u8string_view name = arguments[i].get_name();
        const auto earlier = arguments.first(i);
        const bool is_repeated
            = std::ranges::find(earlier, name, &ast::Argument::get_name) != earlier.end();
        if (is_repeated && std::ranges::find(out, name) == out.end()) {
            out.push_back(name);
        }
    }
}

namespace {

[[nodiscard]]
Handler_Error make_missing_argument_error(std::u8string_view name, Context& context)
{
    std::pmr::u8string message { context.get_memory() };
    message += u8"Missing argument \""sv;
    message += name;
    message += u8"\"."sv;
    return { Handler_Error_Kind::missing_argument, std::move(message) };
}

} // namespace

Handler_Error make_type_mismatch_error(
    std::u8string_view name,
    std::u8string_view expected,
    Literal_Kind actual,
    Context& context
)
{
    std::pmr::u8string message { context.get_memory() };
    message += u8"Argument \""sv;
    message += name;
    message += u8"\" has to be of type "sv;
    message += expected;
    message += u8", but is of type "sv;
    message += literal_kind_name(actual);
    message += u8"."sv;
    return { Handler_Error_Kind::type_mismatch, std::move(message) };
}

Result<const Literal*, Handler_Error>
expect_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const ast::Argument* const argument = call.find_argument(name);
    if (!argument) {
        return make_missing_argument_error(name, context);
    }
    return &argument->get_value();
}

Result<bool, Handler_Error>
get_bool_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const Result<const Literal*, Handler_Error> value = expect_argument(call, name, context);
    if (!value) {
        return value.error();
    }
    if (!(*value)->is_bool()) {
        return make_type_mismatch_error(name, u8"bool"sv, (*value)->get_kind(), context);
    }
    return (*value)->as_boolean();
}

Result<std::u8string_view, Handler_Error>
get_string_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const Result<const Literal*, Handler_Error> value = expect_argument(call, name, context);
    if (!value) {
        return value.error();
    }
    if (!(*value)->is_string()) {
        return make_type_mismatch_error(name, u8"str"sv, (*value)->get_kind(), context);
    }
    return (*value)->as_string();
}

Result<Integer, Handler_Error>
get_integer_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const Result<const Literal*, Handler_Error> value = expect_argument(call, name, context);
    if (!value) {
        return value.error();
    }
    if (!(*value)->is_int()) {
        return make_type_mismatch_error(name, u8"int"sv, (*value)->get_kind(), context);
    }
    return (*value)->as_integer();
}

Result<Integer, Handler_Error>
get_non_negative_integer_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    Result<Integer, Handler_Error> value = get_integer_argument(call, name, context);
    if (!value) {
        return value;
    }
    if (*value < 0) {
        std::pmr::u8string message { context.get_memory() };
        message += u8"Argument \""sv;
        message += name;
        message += u8"\" must not be negative."sv;
        return Handler_Error { Handler_Error_Kind::invalid_value, std::move(message) };
    }
    return value;
}

Result<Float, Handler_Error>
get_float_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const Result<const Literal*, Handler_Error> value = expect_argument(call, name, context);
    if (!value) {
        return value.error();
    }
    if ((*value)->is_int()) {
        return Float((*value)->as_integer());
    }
    if (!(*value)->is_float()) {
        return make_type_mismatch_error(name, u8"float"sv, (*value)->get_kind(), context);
    }
    return (*value)->as_float();
}

Result<const Literal::Array*, Handler_Error>
get_array_argument(const Invocation& call, std::u8string_view name, Context& context)
{
    const Result<const Literal*, Handler_Error> value = expect_argument(call, name, context);
    if (!value) {
        return value.error();
    }
    if (!(*value)->is_array()) {
        return make_type_mismatch_error(name, u8"array"sv, (*value)->get_kind(), context);
    }
    return &(*value)->as_array();
}

Result<std::u8string_view, Handler_Error> get_string_argument_or(
    const Invocation& call,
    std::u8string_view name,
    std::u8string_view fallback,
    Context& context
)
{
    if (!call.find_argument(name)) {
        return fallback;
    }
    return get_string_argument(call, name, context);
}

} // namespace tern
