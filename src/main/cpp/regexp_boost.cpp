#include <algorithm>
#include <cstddef>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tern/util/assert.hpp"
#include "tern/util/chars.hpp"

#include "tern/regexp.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace tern {

static_assert(sizeof(Reg_Exp_Impl) == sizeof(boost::u32regex));

template <typename T>
Reg_Exp_Impl::Reg_Exp_Impl(In_Place_Tag, T&& arg) noexcept
{
    new (m_storage) boost::u32regex(std::forward<T>(arg));
}

auto& Reg_Exp_Impl::get()
{
    return *std::launder(reinterpret_cast<boost::u32regex*>(m_storage));
}

const auto& Reg_Exp_Impl::get() const
{
    return *std::launder(reinterpret_cast<const boost::u32regex*>(m_storage));
}

Reg_Exp_Impl::Reg_Exp_Impl() noexcept
{
    new (m_storage) boost::u32regex;
}

Reg_Exp_Impl::Reg_Exp_Impl(const Reg_Exp_Impl& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, other.get() }
{
}

Reg_Exp_Impl::Reg_Exp_Impl(Reg_Exp_Impl&& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, std::move(other.get()) }
{
}

// boost::basic_regex holds a std::shared_ptr, so self-assignment is harmless.
// NOLINTNEXTLINE(bugprone-unhandled-self-assignment)
Reg_Exp_Impl& Reg_Exp_Impl::operator=(const Reg_Exp_Impl& other) noexcept
{
    get() = other.get();
    return *this;
}

Reg_Exp_Impl& Reg_Exp_Impl::operator=(Reg_Exp_Impl&& other) noexcept
{
    // boost::basic_regex has no move operations (boostorg/regex#270).
    // NOLINTNEXTLINE(performance-move-const-arg)
    get() = std::move(other.get());
    return *this;
}

Reg_Exp_Impl::~Reg_Exp_Impl()
{
    get().~basic_regex();
}

namespace {

[[nodiscard]]
const char* as_chars(const char8_t* str)
{
    return reinterpret_cast<const char*>(str);
}

} // namespace

Result<Reg_Exp, Reg_Exp_Error_Code> Reg_Exp::make(const std::u8string_view pattern)
{
    constexpr auto flags = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;

    const std::u8string boost_pattern = ecma_pattern_to_boost_pattern(pattern);
    const char* const first = as_chars(boost_pattern.data());
    boost::u32regex result = boost::make_u32regex(first, first + boost_pattern.size(), flags);

    if (result.status() != 0) {
        return Reg_Exp_Error_Code::bad_pattern;
    }
    return Reg_Exp { Reg_Exp_Impl { In_Place_Tag {}, std::move(result) } };
}

Reg_Exp_Status Reg_Exp::match(const std::u8string_view string) const
{
    const char* const first = as_chars(string.data());
    try {
        const bool result = boost::u32regex_match(first, first + string.size(), m_impl.get());
        return result ? Reg_Exp_Status::matched : Reg_Exp_Status::unmatched;
    } catch (const std::runtime_error&) {
        return Reg_Exp_Status::execution_error;
    }
}

Reg_Exp_Search_Result Reg_Exp::search(const std::u8string_view string) const
{
    const char* const first = as_chars(string.data());
    boost::match_results<const char*> match;
    try {
        const bool found
            = boost::u32regex_search(first, first + string.size(), match, m_impl.get());
        if (!found) {
            return { Reg_Exp_Status::unmatched, {} };
        }
    } catch (const std::runtime_error&) {
        return { Reg_Exp_Status::execution_error, {} };
    }
    const auto& whole = match[0];
    TERN_ASSERT(whole.matched);
    const Reg_Exp_Match result_match {
        .index = std::size_t(whole.first - first),
        .length = std::size_t(whole.second - whole.first),
    };
    return Reg_Exp_Search_Result { Reg_Exp_Status::matched, result_match };
}

Reg_Exp_Status Reg_Exp::replace_all(
    std::pmr::u8string& out,
    const std::u8string_view string,
    const std::u8string_view replacement
) const
{
    const char* const first = as_chars(string.data());
    const std::string format { as_chars(replacement.data()), replacement.size() };
    try {
        const bool found = boost::u32regex_search(first, first + string.size(), m_impl.get());
        boost::u32regex_replace(
            std::back_inserter(out), first, first + string.size(), m_impl.get(), format
        );
        return found ? Reg_Exp_Status::matched : Reg_Exp_Status::unmatched;
    } catch (const std::runtime_error&) {
        return Reg_Exp_Status::execution_error;
    }
}

std::u8string ecma_pattern_to_boost_pattern(const std::u8string_view ecma_pattern)
{
    // Even with ECMAScript flavor, Boost.Regex treats \u as a class of uppercase characters.
    // All characters involved are ASCII, so the transformation can operate on UTF-8 directly.

    std::u8string result;
    result.reserve(ecma_pattern.size());
    bool escape = false;
    for (std::size_t i = 0; i < ecma_pattern.size(); ++i) {
        const char8_t c = ecma_pattern[i];
        if (!escape) {
            if (c == u8'\\') {
                escape = true;
            }
            else {
                result += c;
            }
            continue;
        }
        escape = false;
        if (c != u8'u') {
            result += u8'\\';
            result += c;
            continue;
        }
        const bool is_unicode_escape = i + 4 < ecma_pattern.size()
            && std::ranges::all_of(ecma_pattern.substr(i + 1, 4), [](char8_t d) {
                   return is_ascii_hex_digit(d);
               });
        if (is_unicode_escape) {
            result += u8"\\x{";
            result += ecma_pattern.substr(i + 1, 4);
            result += u8'}';
            i += 4;
        }
        else {
            // For any other use of "\u" (e.g. /\uZZ/, /\u()/), u is taken literally.
            result += u8'u';
        }
    }
    if (escape) {
        result += u8'\\';
    }
    return result;
}

} // namespace tern
