#ifndef TERN_JSON_HPP
#define TERN_JSON_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "tern/fwd.hpp"

namespace tern::json {

/// @brief Appends `str` as a quoted JSON string to `out`.
/// Quotes, backslashes, and control characters are escaped;
/// all other characters (including non-ASCII UTF-8) are appended as is.
void append_string(std::pmr::u8string& out, std::u8string_view str);

/// @brief Appends the JSON representation of `literal` to `out`.
/// Strings become JSON strings, arrays become JSON arrays,
/// and numbers are written in their shortest round-trip form.
/// Floating-point numbers which have no JSON representation (infinity, NaN)
/// are written as `null`.
void append_literal(std::pmr::u8string& out, const Literal& literal);

/// @brief Appends a JSON object to `out` whose members are the given arguments.
/// If an argument name occurs multiple times, only the last occurrence is written,
/// so every key appears exactly once.
/// Members appear in the order of those last occurrences.
void append_arguments(std::pmr::u8string& out, std::span<const ast::Argument> arguments);

} // namespace tern::json

#endif
