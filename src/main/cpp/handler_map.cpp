#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "tern/util/assert.hpp"
#include "tern/util/strings.hpp"
#include "tern/util/typo.hpp"

#include "tern/context.hpp"
#include "tern/handler_map.hpp"

namespace tern {

bool Handler_Map::insert_or_assign(std::u8string_view name, const Directive_Handler& handler)
{
    TERN_ASSERT(is_tern_identifier(name));
    const auto it = m_handlers.find(name);
    if (it != m_handlers.end()) {
        it->second = &handler;
        return false;
    }
    m_handlers.emplace(std::pmr::u8string { name, m_handlers.get_allocator() }, &handler);
    return true;
}

bool Handler_Map::erase(std::u8string_view name)
{
    const auto it = m_handlers.find(name);
    if (it == m_handlers.end()) {
        return false;
    }
    m_handlers.erase(it);
    return true;
}

bool Handler_Map::contains(std::u8string_view name) const
{
    return m_handlers.find(name) != m_handlers.end();
}

Distant<std::u8string_view>
Handler_Map::fuzzy_lookup_name(std::u8string_view name, Context& context) const
{
    std::pmr::vector<std::u8string_view> names { context.get_transient_memory() };
    names.reserve(m_handlers.size());
    for (const auto& [key, handler] : m_handlers) {
        names.push_back(key);
    }
    // Ties resolve to the lexicographically smallest name.
    std::ranges::sort(names);

    Distant<std::u8string_view> result;
    if (const Distant<std::size_t> own = closest_match(names, name, context.get_transient_memory())) {
        result = { .value = names[own.value], .distance = own.distance };
    }
    if (m_parent) {
        const Distant<std::u8string_view> inherited = m_parent->fuzzy_lookup_name(name, context);
        if (inherited && inherited.distance < result.distance) {
            result = inherited;
        }
    }
    return result;
}

const Directive_Handler* Handler_Map::operator()(std::u8string_view name) const
{
    const auto it = m_handlers.find(name);
    if (it != m_handlers.end()) {
        return it->second;
    }
    return m_parent ? (*m_parent)(name) : nullptr;
}

} // namespace tern
