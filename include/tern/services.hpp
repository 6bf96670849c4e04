#ifndef TERN_SERVICES_HPP
#define TERN_SERVICES_HPP

#include "tern/util/assert.hpp"
#include "tern/util/severity.hpp"

#include "tern/diagnostic.hpp"
#include "tern/fwd.hpp"

namespace tern {

/// @brief Receives the diagnostics emitted while a document is rendered.
/// Diagnostics below the minimum severity are filtered out by the `Context`
/// before they reach the logger,
/// so that no message needs to be composed for them.
struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        TERN_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    /// @brief Returns `true` if diagnostics of the given `severity` are logged.
    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

/// @brief Discards all diagnostics.
struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace tern

#endif
