#ifndef TERN_CONTEXT_HPP
#define TERN_CONTEXT_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "tern/util/assert.hpp"
#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"

#include "tern/ast.hpp"
#include "tern/diagnostic.hpp"
#include "tern/directive_handler.hpp"
#include "tern/fwd.hpp"
#include "tern/services.hpp"

namespace tern {

/// @brief Produces replacement text for calls whose evaluation failed.
/// If a fallback is installed, failed calls are reported to the logger,
/// but do not abort the evaluation of the surrounding document.
struct Error_Fallback {
    virtual void operator()(
        std::pmr::u8string& out,
        const ast::Call& call,
        const Evaluation_Error& error,
        Context& context
    ) const
        = 0;
};

/// @brief Replaces failed calls with their own source code, as if they had been text.
struct Source_Fallback final : Error_Fallback {
    void operator()(std::pmr::u8string& out, const ast::Call& call, const Evaluation_Error&, Context&)
        const final
    {
        out += call.get_source();
    }
};

/// @brief Removes failed calls from the output.
struct Empty_Fallback final : Error_Fallback {
    void operator()(std::pmr::u8string&, const ast::Call&, const Evaluation_Error&, Context&)
        const final
    {
    }
};

inline constinit const Source_Fallback source_fallback {};
inline constinit const Empty_Fallback empty_fallback {};

struct Evaluation_Options {
    /// @brief The fallback used for calls which failed to evaluate.
    /// If null, the first failure aborts evaluation.
    const Error_Fallback* fallback = nullptr;
    /// @brief If `true`, a `duplicate.args` warning is emitted for every call
    /// where the same argument name is provided more than once.
    bool warn_duplicate_arguments = true;
};

/// @brief Stores the state that persists throughout the evaluation of a document,
/// as well as the services (registry, logger) that are used during evaluation.
struct Context {
public:
    using char_type = char8_t;
    using string_view_type = std::u8string_view;
    using string_type = std::pmr::u8string;

private:
    const Function_Registry& m_registry;
    Logger& m_logger;
    std::pmr::memory_resource* const m_memory;
    std::pmr::memory_resource* const m_transient_memory;
    Evaluation_Options m_options;

public:
    /// @brief Constructs a new context.
    /// @param registry The registry used to look up directives.
    /// @param logger Receives diagnostics emitted during evaluation.
    /// @param memory Memory for output, error messages, and anything else that persists
    /// beyond the evaluation.
    /// @param transient_memory Memory for temporary allocations,
    /// such as the matrix for typo detection.
    /// @param options Error handling and diagnostic options.
    [[nodiscard]]
    explicit Context(
        const Function_Registry& registry,
        Logger& logger,
        std::pmr::memory_resource* memory,
        std::pmr::memory_resource* transient_memory,
        const Evaluation_Options& options = {}
    )
        : m_registry { registry }
        , m_logger { logger }
        , m_memory { memory }
        , m_transient_memory { transient_memory }
        , m_options { options }
    {
        TERN_ASSERT(memory);
        TERN_ASSERT(transient_memory);
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    ~Context() = default;

    [[nodiscard]]
    const Function_Registry& get_registry() const
    {
        return m_registry;
    }

    [[nodiscard]]
    Logger& get_logger()
    {
        return m_logger;
    }
    [[nodiscard]]
    const Logger& get_logger() const
    {
        return m_logger;
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return m_memory;
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_transient_memory() const
    {
        return m_transient_memory;
    }

    [[nodiscard]]
    const Evaluation_Options& get_options() const
    {
        return m_options;
    }

    void set_options(const Evaluation_Options& options)
    {
        m_options = options;
    }

    /// @brief Returns the inclusive minimum level of diagnostics that are currently emitted.
    /// This may be `none`, in which case no diagnostic are emitted.
    [[nodiscard]]
    Severity get_min_diagnostic_level() const
    {
        return m_logger.get_min_severity();
    }

    /// @brief Equivalent to `get_logger().can_log(severity)`.
    [[nodiscard]]
    bool emits(Severity severity) const
    {
        return m_logger.can_log(severity);
    }

    void emit(Diagnostic diagnostic)
    {
        TERN_ASSERT(emits(diagnostic.severity));
        m_logger(diagnostic);
    }

    void try_emit(
        Severity severity,
        string_view_type id,
        const Source_Span& location,
        string_view_type message
    )
    {
        if (emits(severity)) {
            emit({ severity, id, location, message });
        }
    }

    void try_debug(string_view_type id, const Source_Span& location, string_view_type message)
    {
        try_emit(Severity::debug, id, location, message);
    }

    void try_warning(string_view_type id, const Source_Span& location, string_view_type message)
    {
        try_emit(Severity::warning, id, location, message);
    }

    void try_error(string_view_type id, const Source_Span& location, string_view_type message)
    {
        try_emit(Severity::error, id, location, message);
    }
};

} // namespace tern

#endif
