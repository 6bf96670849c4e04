#ifndef TERN_REGEXP_HPP
#define TERN_REGEXP_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/result.hpp"

#include "tern/fwd.hpp"

namespace tern {

struct Reg_Exp_Match {
    std::size_t index;
    std::size_t length;
};

enum struct Reg_Exp_Error_Code : Default_Underlying {
    /// @brief The given pattern is not valid.
    bad_pattern,
};

enum struct Reg_Exp_Status : Default_Underlying {
    /// @brief Execution completed; no match was found.
    unmatched,
    /// @brief Execution completed; a match was found.
    matched,
    /// @brief An error occurred while trying to execute the regular expression,
    /// such as exceeding complexity limits.
    execution_error,
};

struct Reg_Exp_Search_Result {
    Reg_Exp_Status status;
    Reg_Exp_Match match;
};

struct In_Place_Tag { };

struct Reg_Exp;

struct Reg_Exp_Impl {
private:
    alignas(8) unsigned char m_storage[16];

public:
    Reg_Exp_Impl() noexcept;
    Reg_Exp_Impl(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl(Reg_Exp_Impl&&) noexcept;

    Reg_Exp_Impl& operator=(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl& operator=(Reg_Exp_Impl&&) noexcept;

    ~Reg_Exp_Impl();

private:
    template <typename T>
    Reg_Exp_Impl(In_Place_Tag, T&&) noexcept;

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;

    friend Reg_Exp;
};

/// @brief Represents an ECMAScript-flavored regular expression.
///
/// A `Reg_Exp` has shared ownership over the underlying compiled regular expression,
/// meaning that both copying and moving are relatively inexpensive.
struct Reg_Exp {
public:
    [[nodiscard]]
    static Result<Reg_Exp, Reg_Exp_Error_Code> make(std::u8string_view pattern);

private:
    Reg_Exp_Impl m_impl;

    [[nodiscard]]
    explicit Reg_Exp(Reg_Exp_Impl&& impl) noexcept
        : m_impl { std::move(impl) }
    {
    }

public:
    /// @brief Returns `matched` if `string` matches this regex in its entirety.
    [[nodiscard]]
    Reg_Exp_Status match(std::u8string_view string) const;

    /// @brief Returns `matched` if `string` contains an occurrence of this regex,
    /// as well as the location of the first such occurrence.
    [[nodiscard]]
    Reg_Exp_Search_Result search(std::u8string_view string) const;

    /// @brief Appends `string` to `out`, with every occurrence of this regular expression
    /// replaced by `replacement`.
    /// The replacement uses ECMAScript format syntax, such as `$&` for the whole match
    /// or `$1` for the first capture group.
    /// @returns `matched` if any replacement took place, `unmatched` if none did,
    /// or `execution_error`, in which case the contents of `out` are unspecified.
    [[nodiscard]]
    Reg_Exp_Status replace_all(
        std::pmr::u8string& out,
        std::u8string_view string,
        std::u8string_view replacement
    ) const;
};

/// @brief Rewrites `\uDDDD` escape sequences in an ECMAScript pattern
/// into the `\x{DDDD}` form understood by Boost.Regex.
/// Everything else is left unchanged.
[[nodiscard]]
std::u8string ecma_pattern_to_boost_pattern(std::u8string_view ecma_pattern);

} // namespace tern

#endif
