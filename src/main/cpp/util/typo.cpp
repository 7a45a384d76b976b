#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "lamp/util/levenshtein.hpp"
#include "lamp/util/typo.hpp"
#include "lamp/util/unicode.hpp"

namespace lamp {

namespace {

void append_code_points(std::pmr::u32string& out, std::u8string_view str)
{
    while (!str.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(str);
        out.push_back(code_point);
        str.remove_prefix(std::size_t(length));
    }
}

} // namespace

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u32string needle32 { memory };
    append_code_points(needle32, needle);
    std::pmr::u32string hay32 { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        hay32.clear();
        append_code_points(hay32, haystack[i]);
        const std::size_t distance = levenshtein_distance(hay32, needle32, memory);
        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace lamp
