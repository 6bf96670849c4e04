#ifndef TERN_RESULT_HPP
#define TERN_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "tern/util/assert.hpp"

#include "tern/fwd.hpp"

namespace tern {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Holds either a value of type `T` or an error of type `E`.
/// This is the return type of operations that can fail in an expected way;
/// no exceptions are involved.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "Use the tagged constructors instead.");
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>);

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_value;

public:
    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
        : m_value { std::in_place_index<0> }
    {
    }

    [[nodiscard]]
    constexpr Result(const T& value)
        : m_value { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_value { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_value { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_value { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_value { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_value { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_value.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        TERN_ASSERT(has_value());
        return *std::get_if<0>(&m_value);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        TERN_ASSERT(has_value());
        return *std::get_if<0>(&m_value);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        TERN_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_value));
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        TERN_ASSERT(!has_value());
        return *std::get_if<1>(&m_value);
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TERN_ASSERT(!has_value());
        return *std::get_if<1>(&m_value);
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TERN_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_value));
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&) = default;
};

/// @brief Specialization for operations that produce no value on success.
template <typename E>
struct [[nodiscard]] Result<void, E> {
    static_assert(!std::is_reference_v<E>);

    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_error { std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_error { std::in_place, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    constexpr void value() const
    {
        TERN_ASSERT(has_value());
    }

    constexpr void operator*() const
    {
        TERN_ASSERT(has_value());
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        TERN_ASSERT(!has_value());
        return *m_error;
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TERN_ASSERT(!has_value());
        return *m_error;
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TERN_ASSERT(!has_value());
        return std::move(*m_error);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result&, const Result&) = default;
};

} // namespace tern

#endif
