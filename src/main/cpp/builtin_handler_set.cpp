#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "tern/util/strings.hpp"
#include "tern/util/typo.hpp"

#include "tern/builtin_handler_set.hpp"
#include "tern/context.hpp"
#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"

using namespace std::string_view_literals;

namespace tern {
namespace {

constexpr Join_Handler join //
    {};
constexpr JSON_Handler json //
    {};
constexpr Case_Transform_Handler lower //
    { Text_Transformation::lowercase };
constexpr Regex_Replace_Handler regex_replace //
    {};
constexpr Repeat_Handler repeat //
    {};
constexpr Case_Transform_Handler upper //
    { Text_Transformation::uppercase };

struct Name_And_Handler {
    std::u8string_view name;
    const Directive_Handler* handler;
};

#define TERN_NAME_AND_HANDLER_ENTRY(...) { u8## #__VA_ARGS__##sv, &__VA_ARGS__ }

constexpr Name_And_Handler handlers_by_name[] {
    TERN_NAME_AND_HANDLER_ENTRY(join),
    TERN_NAME_AND_HANDLER_ENTRY(json),
    TERN_NAME_AND_HANDLER_ENTRY(lower),
    TERN_NAME_AND_HANDLER_ENTRY(regex_replace),
    TERN_NAME_AND_HANDLER_ENTRY(repeat),
    TERN_NAME_AND_HANDLER_ENTRY(upper),
};

static_assert(std::ranges::is_sorted(handlers_by_name, {}, &Name_And_Handler::name));
static_assert(std::ranges::all_of(handlers_by_name, [](const Name_And_Handler& entry) {
    return is_tern_identifier(entry.name);
}));

} // namespace

Distant<std::u8string_view>
Builtin_Handler_Set::fuzzy_lookup_name(std::u8string_view name, Context& context) const
{
    static constexpr auto all_names = [] {
        std::array<std::u8string_view, std::size(handlers_by_name)> result;
        std::ranges::transform(handlers_by_name, result.data(), &Name_And_Handler::name);
        return result;
    }();
    const Distant<std::size_t> result
        = closest_match(all_names, name, context.get_transient_memory());
    if (!result) {
        return {};
    }
    return { .value = all_names[result.value], .distance = result.distance };
}

const Directive_Handler* Builtin_Handler_Set::operator()(std::u8string_view name) const
{
    const auto* const it
        = std::ranges::lower_bound(handlers_by_name, name, {}, &Name_And_Handler::name);
    if (it == std::end(handlers_by_name) || it->name != name) {
        return nullptr;
    }
    return it->handler;
}

} // namespace tern
