#ifndef TERN_LEVENSHTEIN_HPP
#define TERN_LEVENSHTEIN_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "tern/util/assert.hpp"

namespace tern {

// https://en.wikipedia.org/wiki/Levenshtein_distance

/// @brief Computes the Levenshtein distance between `x` and `y` code unit by code unit.
/// Only two rows of the distance matrix are kept,
/// and they are stored in `rows`, which shall have at least `2 * (y.size() + 1)` elements.
[[nodiscard]]
constexpr std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::span<std::size_t> rows
)
{
    if (x.empty()) {
        return y.size();
    }
    if (y.empty()) {
        return x.size();
    }

    const std::size_t row_size = y.size() + 1;
    TERN_ASSERT(rows.size() >= 2 * row_size);

    std::span<std::size_t> previous = rows.subspan(0, row_size);
    std::span<std::size_t> current = rows.subspan(row_size, row_size);

    for (std::size_t j = 0; j < row_size; ++j) {
        previous[j] = j;
    }

    for (std::size_t i = 1; i <= x.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= y.size(); ++j) {
            const auto sub_cost = std::size_t(x[i - 1] != y[j - 1]);
            // clang-format off
            current[j] = std::min({
                previous[j    ] + 1,       // deletion
                current [j - 1] + 1,       // insertion
                previous[j - 1] + sub_cost // substitution
            });
            // clang-format on
        }
        std::swap(previous, current);
    }

    return previous[y.size()];
}

/// @brief Like the overload taking a span,
/// but allocates the required rows using `memory`.
[[nodiscard]]
inline std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> rows(2 * (y.size() + 1), memory);
    return code_unit_levenshtein_distance(x, y, rows);
}

} // namespace tern

#endif
