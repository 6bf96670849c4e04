#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/result.hpp"

#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/directive_handler.hpp"
#include "tern/invocation.hpp"
#include "tern/regexp.hpp"

using namespace std::string_view_literals;

namespace tern {

Result<void, Handler_Error> Regex_Replace_Handler::operator()(
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
    const Result<std::u8string_view, Handler_Error> pattern
        = get_string_argument(call, u8"pattern"sv, context);
    if (!pattern) {
        return pattern.error();
    }
    const Result<std::u8string_view, Handler_Error> replacement
        = get_string_argument(call, u8"replacement"sv, context);
    if (!replacement) {
        return replacement.error();
    }

    const Result<Reg_Exp, Reg_Exp_Error_Code> regex = Reg_Exp::make(*pattern);
    if (!regex) {
        std::pmr::u8string message { context.get_memory() };
        message += u8"The pattern \""sv;
        message += *pattern;
        message += u8"\" is not a valid regular expression."sv;
        return Handler_Error { Handler_Error_Kind::invalid_value, std::move(message) };
    }

    const Reg_Exp_Status status = regex->replace_all(out, *text, *replacement);
    if (status == Reg_Exp_Status::execution_error) {
        std::pmr::u8string message { context.get_memory() };
        message += u8"Execution of the regular expression \""sv;
        message += *pattern;
        message += u8"\" failed, possibly because it is too complex."sv;
        return Handler_Error { Handler_Error_Kind::other, std::move(message) };
    }
    return {};
}

} // namespace tern
