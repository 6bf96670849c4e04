#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "tern/util/levenshtein.hpp"
#include "tern/util/typo.hpp"

namespace tern {

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> rows { memory };
    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::u8string_view hay = haystack[i];
        rows.resize(2 * (needle.size() + 1));
        const std::size_t distance = code_unit_levenshtein_distance(hay, needle, rows);

        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace tern
