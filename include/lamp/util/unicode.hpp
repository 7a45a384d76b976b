#ifndef LAMP_UNICODE_HPP
#define LAMP_UNICODE_HPP

#include <cstddef>
#include <string_view>

#include "ulight/impl/unicode.hpp"
#include "ulight/impl/unicode_algorithm.hpp"

namespace lamp::utf8 {

using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::is_valid;

/// @brief Returns the length of the first code point in `str`, in code units.
/// An illegal code unit is treated as a one-unit long U+FFFD REPLACEMENT CHARACTER.
/// `str` shall not be empty.
[[nodiscard]]
constexpr std::size_t leading_code_point_length(std::u8string_view str) noexcept
{
    const auto [_, length] = decode_and_length_or_replacement(str);
    return std::size_t(length);
}

/// @brief Returns the length of `str`, in code points.
/// Any illegal code units are counted as one code point,
/// which is consistent with treating them as a U+FFFD REPLACEMENT CHARACTER.
[[nodiscard]]
constexpr std::size_t count_code_points_or_replacement(std::u8string_view str) noexcept
{
    std::size_t result = 0;
    while (!str.empty()) {
        str.remove_prefix(leading_code_point_length(str));
        ++result;
    }
    return result;
}

/// @brief Returns the length, in code units, of the last `n` code points in `str`,
/// or `std::u8string_view::npos` if `str` contains fewer than `n` code points.
/// A code point is the last lead unit together with the continuation units that follow it.
[[nodiscard]]
constexpr std::size_t length_trailing_code_points(std::u8string_view str, std::size_t n) noexcept
{
    std::size_t length = 0;
    for (; n != 0; --n) {
        if (length == str.size()) {
            return std::u8string_view::npos;
        }
        do {
            ++length;
        } while (length < str.size() && (str[str.size() - length] & 0xc0) == 0x80);
    }
    return length;
}

} // namespace lamp::utf8

#endif
