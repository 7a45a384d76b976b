#ifndef LAMP_LEVENSHTEIN_HPP
#define LAMP_LEVENSHTEIN_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "lamp/util/assert.hpp"

namespace lamp {

// https://en.wikipedia.org/wiki/Levenshtein_distance

/// @brief Computes the Levenshtein distance between `x` and `y`,
/// counting code units as the unit of edit.
/// Only two rows of the distance matrix are kept, so the space used is linear in `y.size()`.
[[nodiscard]]
inline std::size_t levenshtein_distance(
    std::u32string_view x,
    std::u32string_view y,
    std::pmr::memory_resource* memory
)
{
    if (x.empty()) {
        return y.size();
    }
    if (y.empty()) {
        return x.size();
    }

    std::pmr::vector<std::size_t> previous(y.size() + 1, memory);
    std::pmr::vector<std::size_t> current(y.size() + 1, memory);
    for (std::size_t j = 0; j <= y.size(); ++j) {
        previous[j] = j;
    }

    for (std::size_t i = 1; i <= x.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= y.size(); ++j) {
            const std::size_t sub_cost = x[i - 1] == y[j - 1] ? 0 : 1;
            // clang-format off
            current[j] = std::min({
                previous[j] + 1,            // deletion
                current[j - 1] + 1,         // insertion
                previous[j - 1] + sub_cost  // substitution
            });
            // clang-format on
        }
        previous.swap(current);
    }

    LAMP_DEBUG_ASSERT(previous.size() == y.size() + 1);
    return previous.back();
}

} // namespace lamp

#endif
