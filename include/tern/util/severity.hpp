#ifndef TERN_SEVERITY_HPP
#define TERN_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "tern/fwd.hpp"

namespace tern {

enum struct Severity : Default_Underlying {
    /// @brief The lowest severity; used only as a logger threshold.
    min = 0,
    /// @brief Extremely detailed output, such as the decisions the parser makes.
    trace = 10,
    debug = 20,
    info = 30,
    /// @brief Warnings about things which are probably intentional, but could be mistakes.
    soft_warning = 40,
    warning = 50,
    error = 70,
    fatal = 90,
    max = fatal,
    /// @brief Higher than any emittable severity; used as a threshold to disable logging.
    none = 100,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case min: return u8"MIN";
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

} // namespace tern

#endif
