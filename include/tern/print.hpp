#ifndef TERN_PRINT_HPP
#define TERN_PRINT_HPP

#include <iosfwd>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "tern/util/severity.hpp"
#include "tern/util/source_position.hpp"

#include "tern/diagnostic.hpp"
#include "tern/fwd.hpp"
#include "tern/services.hpp"

namespace tern {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
/// @param out the string to write to
/// @param source the document source
/// @param pos the span within the source
void print_affected_line(std::pmr::u8string& out, std::u8string_view source, const Source_Span& pos);

/// @brief Prints a diagnostic in the form `line:column: SEVERITY: message [id]`,
/// followed by the affected line if the diagnostic location is not empty.
void print_diagnostic(std::pmr::u8string& out, std::u8string_view source, const Diagnostic& diagnostic);

/// @brief Prints a literal for debugging, such as `Int(1)` or `Array([Str("a"), Bool(true)])`.
void print_literal(std::pmr::u8string& out, const Literal& literal);

/// @brief Prints one line per node in `nodes`,
/// such as `Text("Hello ")` or `Call(name, [x=Int(1)])`.
void print_ast(std::pmr::u8string& out, std::span<const ast::Node> nodes);

/// @brief A logger which appends every diagnostic to a string,
/// formatted by `print_diagnostic`.
/// The locations of diagnostics refer to `source`.
struct Printing_Logger final : Logger {
private:
    std::pmr::u8string& m_out;
    std::u8string_view m_source;

public:
    [[nodiscard]]
    explicit Printing_Logger(
        std::pmr::u8string& out,
        std::u8string_view source,
        Severity min_severity = Severity::warning
    )
        : Logger { min_severity }
        , m_out { out }
        , m_source { source }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        print_diagnostic(m_out, m_source, diagnostic);
    }
};

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

} // namespace tern

#endif
