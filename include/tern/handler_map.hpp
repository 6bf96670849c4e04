#ifndef TERN_HANDLER_MAP_HPP
#define TERN_HANDLER_MAP_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tern/util/transparent_comparison.hpp"
#include "tern/util/typo.hpp"

#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"

namespace tern {

/// @brief A mutable `Function_Registry` which maps names onto handlers owned elsewhere.
/// Names which are not found in the map are looked up in the parent registry, if any.
/// Entries in the map shadow entries of the same name in the parent.
struct Handler_Map final : Function_Registry {
    using Map = std::pmr::unordered_map<
        std::pmr::u8string,
        const Directive_Handler*,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>;

private:
    Map m_handlers;
    const Function_Registry* m_parent;

public:
    [[nodiscard]]
    explicit Handler_Map(
        std::pmr::memory_resource* memory,
        const Function_Registry* parent = nullptr
    )
        : m_handlers { memory }
        , m_parent { parent }
    {
    }

    [[nodiscard]]
    const Function_Registry* get_parent() const noexcept
    {
        return m_parent;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_handlers.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_handlers.empty();
    }

    /// @brief Maps `name` onto `handler`, replacing any previous handler of the same name.
    /// The handler has to outlive this map.
    /// `name` shall be a valid identifier; any other name could never be called.
    /// @returns `true` if `name` was not mapped before, `false` if a handler was replaced.
    bool insert_or_assign(std::u8string_view name, const Directive_Handler& handler);

    /// @brief Removes the handler named `name` from this map.
    /// The parent registry is not affected.
    /// @returns `true` if a handler was removed.
    bool erase(std::u8string_view name);

    /// @brief Returns `true` if this map itself (not considering the parent) contains `name`.
    [[nodiscard]]
    bool contains(std::u8string_view name) const;

    [[nodiscard]]
    Distant<std::u8string_view>
    fuzzy_lookup_name(std::u8string_view name, Context& context) const final;

    [[nodiscard]]
    const Directive_Handler* operator()(std::u8string_view name) const final;
};

} // namespace tern

#endif
