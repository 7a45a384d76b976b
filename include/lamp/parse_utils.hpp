#ifndef LAMP_PARSE_UTILS_HPP
#define LAMP_PARSE_UTILS_HPP

#include <cstddef>
#include <string_view>

namespace lamp {

struct Blank_Line {
    std::size_t begin;
    std::size_t length;

    [[nodiscard]]
    constexpr explicit operator bool() const
    {
        return length != 0;
    }

    [[nodiscard]]
    friend constexpr bool operator==(Blank_Line, Blank_Line)
        = default;
};

/// @brief Returns a `Blank_Line` where `begin` is the index of the first character
/// that is part of the first blank line sequence in `str`,
/// and where `length` is the length of the blank line sequence, in code units.
/// A blank line sequence that is not at the end of `str` always ends with `\\n`.
///
/// `str` is assumed to begin at the start of a line.
/// The terminating `\\n` of the previous line is not part of the blank line sequence.
/// For example, in `"first\\n\\t\\t\\n\\n second"`,
/// the blank line sequence consists of `"\\t\\t\\n\\n"`.
[[nodiscard]]
Blank_Line find_blank_line_sequence(std::u8string_view str) noexcept;

/// @brief Returns the length of the blank lines at the start of `str`,
/// i.e. the index at which the first non-blank line begins,
/// or `str.length()` if all lines are blank.
[[nodiscard]]
std::size_t length_leading_blank_lines(std::u8string_view str) noexcept;

/// @brief Returns the index of the first `\\n` in `str`, or `str.length()` if there is none.
[[nodiscard]]
constexpr std::size_t line_length(std::u8string_view str) noexcept
{
    const std::size_t result = str.find(u8'\n');
    return result == std::u8string_view::npos ? str.length() : result;
}

} // namespace lamp

#endif
