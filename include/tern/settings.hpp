#ifndef TERN_SETTINGS_HPP
#define TERN_SETTINGS_HPP

#include <cstddef>
#include <string_view>

#ifndef NDEBUG // debug builds
#define TERN_DEBUG 1
#define TERN_IF_DEBUG(...) __VA_ARGS__
#define TERN_IF_NOT_DEBUG(...)
#else // release builds
#define TERN_IF_DEBUG(...)
#define TERN_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

namespace tern {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = TERN_IF_DEBUG(true) TERN_IF_NOT_DEBUG(false);

/// @brief The amount of `AST_Instruction`s reserved up front per kilobyte of source text.
/// Documents are mostly prose, so most kilobytes produce only a handful of instructions.
inline constexpr std::size_t instructions_per_kilobyte = 16;

/// @brief The greatest depth to which array literals can be nested.
/// A call containing more deeply nested arrays is not recognized and remains text.
inline constexpr std::size_t max_array_depth = 256;

/// @brief The placeholder which stands in for calls during deferred expansion,
/// unless the embedder provides a different one.
inline constexpr std::u8string_view default_placeholder = u8"@@TERN_SHORTCODE@@";

} // namespace tern

#endif
