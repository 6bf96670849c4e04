#ifndef TERN_LITERAL_HPP
#define TERN_LITERAL_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tern/util/assert.hpp"

#include "tern/fwd.hpp"

namespace tern {

enum struct Literal_Kind : Default_Underlying {
    /// @brief `true` or `false`.
    boolean,
    /// @brief A quoted string, such as `"abc"`, `'abc'`, or `` `abc` ``.
    string,
    /// @brief A decimal integer, such as `-123`.
    integer,
    /// @brief A decimal floating-point number with mandatory fraction, such as `1.5`.
    floating,
    /// @brief A bracketed list of literals, such as `[1, "a", [true]]`.
    array,
};

/// @brief Returns the name of the kind as it would appear in diagnostics,
/// such as `u8"int"` for `Literal_Kind::integer`.
[[nodiscard]]
std::u8string_view literal_kind_name(Literal_Kind kind);

/// @brief A constant value as it appears in the argument of a directive call.
/// Strings are views into the source document,
/// so a `Literal` shall not outlive the document it was parsed from.
struct Literal {
    using Array = std::pmr::vector<Literal>;

private:
    // The order of alternatives matches Literal_Kind.
    std::variant<bool, std::u8string_view, Integer, Float, Array> m_value;

    template <std::size_t index, typename T>
    [[nodiscard]]
    explicit Literal(std::in_place_index_t<index> tag, T&& value)
        : m_value { tag, std::forward<T>(value) }
    {
    }

public:
    [[nodiscard]]
    static Literal boolean(bool value)
    {
        return Literal { std::in_place_index<0>, value };
    }

    /// @brief Creates a string literal.
    /// @param value The content of the string, without delimiters.
    [[nodiscard]]
    static Literal string(std::u8string_view value)
    {
        return Literal { std::in_place_index<1>, value };
    }

    [[nodiscard]]
    static Literal integer(Integer value)
    {
        return Literal { std::in_place_index<2>, value };
    }

    [[nodiscard]]
    static Literal floating(Float value)
    {
        return Literal { std::in_place_index<3>, value };
    }

    [[nodiscard]]
    static Literal array(Array&& elements)
    {
        return Literal { std::in_place_index<4>, std::move(elements) };
    }

    [[nodiscard]]
    Literal_Kind get_kind() const noexcept
    {
        return Literal_Kind(m_value.index());
    }

    [[nodiscard]]
    bool is_bool() const noexcept
    {
        return get_kind() == Literal_Kind::boolean;
    }
    [[nodiscard]]
    bool is_string() const noexcept
    {
        return get_kind() == Literal_Kind::string;
    }
    [[nodiscard]]
    bool is_int() const noexcept
    {
        return get_kind() == Literal_Kind::integer;
    }
    [[nodiscard]]
    bool is_float() const noexcept
    {
        return get_kind() == Literal_Kind::floating;
    }
    [[nodiscard]]
    bool is_array() const noexcept
    {
        return get_kind() == Literal_Kind::array;
    }

    [[nodiscard]]
    bool as_boolean() const
    {
        TERN_DEBUG_ASSERT(is_bool());
        return *std::get_if<0>(&m_value);
    }
    [[nodiscard]]
    std::u8string_view as_string() const
    {
        TERN_DEBUG_ASSERT(is_string());
        return *std::get_if<1>(&m_value);
    }
    [[nodiscard]]
    Integer as_integer() const
    {
        TERN_DEBUG_ASSERT(is_int());
        return *std::get_if<2>(&m_value);
    }
    [[nodiscard]]
    Float as_float() const
    {
        TERN_DEBUG_ASSERT(is_float());
        return *std::get_if<3>(&m_value);
    }
    [[nodiscard]]
    const Array& as_array() const
    {
        TERN_DEBUG_ASSERT(is_array());
        return *std::get_if<4>(&m_value);
    }

    /// @brief Two literals are equal if they have the same kind and the same value.
    /// In particular, `1` and `1.0` are not equal,
    /// and strings compare equal regardless of their original delimiters.
    [[nodiscard]]
    friend bool operator==(const Literal& x, const Literal& y)
    {
        return x.m_value == y.m_value;
    }
};

/// @brief Appends the textual form of `literal` to `out`,
/// which is the content for strings, `true` or `false` for booleans,
/// and the decimal representation for numbers.
/// Arrays have no textual form.
/// @returns `true` on success, `false` if `literal` is an array, in which case nothing is
/// appended.
[[nodiscard]]
bool append_as_text(std::pmr::u8string& out, const Literal& literal);

} // namespace tern

#endif
