#include <memory_resource>
#include <string>

#include "tern/util/result.hpp"

#include "tern/builtin_handler_set.hpp"
#include "tern/directive_handler.hpp"
#include "tern/invocation.hpp"
#include "tern/json.hpp"

namespace tern {

Result<void, Handler_Error>
JSON_Handler::operator()(std::pmr::u8string& out, const Invocation& call, Context&) const
{
    json::append_arguments(out, call.arguments);
    return {};
}

} // namespace tern
