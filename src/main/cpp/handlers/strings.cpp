#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/result.hpp"
#include "tern/util/strings.hpp"

#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/directive_handler.hpp"
#include "tern/invocation.hpp"
#include "tern/literal.hpp"

using namespace std::string_view_literals;

namespace tern {

Result<void, Handler_Error> Case_Transform_Handler::operator()(
    std::pmr::u8string& out,
    const Invocation& call,
    Context& context
) const
{
    const Result<std::u8string_view, Handler_Error> text
        = get_string_argument(call, u8"text"sv, context);
    if (!text) {
        return text.error();
    }

    const std::size_t initial_size = out.size();
    out += *text;
    const std::span<char8_t> appended { out.data() + initial_size, text->size() };
    if (m_transform == Text_Transformation::uppercase) {
        to_ascii_upper_inplace(appended);
    }
    else {
        to_ascii_lower_inplace(appended);
    }
    return {};
}

Result<void, Handler_Error>
Repeat_Handler::operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const
{
    const Result<std::u8string_view, Handler_Error> text
        = get_string_argument(call, u8"text"sv, context);
    if (!text) {
        return text.error();
    }
    const Result<Integer, Handler_Error> times
        = get_non_negative_integer_argument(call, u8"times"sv, context);
    if (!times) {
        return times.error();
    }

    if (text->empty()) {
        return {};
    }
    constexpr std::size_t max_output_size = std::size_t(1) << 24;
    if (std::size_t(*times) > max_output_size / text->size()) {
        std::pmr::u8string message { context.get_memory() };
        message += u8"The result of repeating the text would be too long."sv;
        return Handler_Error { Handler_Error_Kind::invalid_value, std::move(message) };
    }

    out.reserve(out.size() + (text->size() * std::size_t(*times)));
    for (Integer i = 0; i < *times; ++i) {
        out += *text;
    }
    return {};
}

Result<void, Handler_Error>
Join_Handler::operator()(std::pmr::u8string& out, const Invocation& call, Context& context) const
{
    const Result<const Literal::Array*, Handler_Error> items
        = get_array_argument(call, u8"items"sv, context);
    if (!items) {
        return items.error();
    }
    const Result<std::u8string_view, Handler_Error> separator
        = get_string_argument_or(call, u8"separator"sv, u8""sv, context);
    if (!separator) {
        return separator.error();
    }

    bool first = true;
    for (const Literal& item : **items) {
        if (!first) {
            out += *separator;
        }
        first = false;
        if (!append_as_text(out, item)) {
            std::pmr::u8string message { context.get_memory() };
            message += u8"Elements of argument \"items\" have to be of type "
                       u8"bool, str, int, or float, but an element is of type "sv;
            message += literal_kind_name(item.get_kind());
            message += u8"."sv;
            return Handler_Error { Handler_Error_Kind::type_mismatch, std::move(message) };
        }
    }
    return {};
}

} // namespace tern
