#ifndef TERN_DIAGNOSTIC_HPP
#define TERN_DIAGNOSTIC_HPP

#include <string_view>

#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"

#include "tern/fwd.hpp"

namespace tern {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The span of code that is responsible for this diagnostic.
    Source_Span location;
    /// @brief The diagnostic message.
    /// This is only valid for the duration of the call to the logger.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief Directive lookup failed.
inline constexpr std::u8string_view directive_lookup_unresolved = u8"directive-lookup.unresolved";

/// @brief The handler of a directive reported an error.
inline constexpr std::u8string_view directive_failed = u8"directive.failed";

/// @brief Duplicate arguments to a directive were provided.
/// Only the last of the duplicates is taken into account.
inline constexpr std::u8string_view duplicate_args = u8"duplicate.args";

/// @brief A `{{` in the document did not begin a well-formed call,
/// and was treated as text instead.
inline constexpr std::u8string_view shortcode_degraded = u8"shortcode.degraded";

/// @brief In deferred expansion,
/// the amount of placeholders in the staged text does not match the amount of calls.
inline constexpr std::u8string_view deferred_mismatch = u8"deferred.mismatch";

} // namespace diagnostic

} // namespace tern

#endif
