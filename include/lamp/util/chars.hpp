#ifndef LAMP_CHARS_HPP
#define LAMP_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace lamp {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::is_html_whitespace;
using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs,
/// unlike `is_ascii_whitespace`.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

/// @brief Returns true if `c` is a space or a horizontal tab.
/// These are the characters which make up indentation.
[[nodiscard]]
constexpr bool is_indentation(char8_t c)
{
    return c == u8' ' || c == u8'\t';
}

/// @brief Returns `true` if `c` may appear between the elements of a directive declaration,
/// i.e. a space, horizontal tab, or line feed.
[[nodiscard]]
constexpr bool is_declaration_whitespace(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n';
}

/// @brief Returns `true` if `c` can start a directive, attribute, or body name.
[[nodiscard]]
constexpr bool is_name_start(char8_t c)
{
    return is_ascii_alpha(c);
}

/// @brief Returns `true` if `c` can continue a directive, attribute, or body name.
[[nodiscard]]
constexpr bool is_name_continuation(char8_t c)
{
    return is_ascii_alphanumeric(c) || c == u8'-' || c == u8'_';
}

/// @brief Returns `true` if `c` can continue the name in a context reference,
/// such as `{{config.title}}`.
[[nodiscard]]
constexpr bool is_reference_name_continuation(char8_t c)
{
    return is_name_continuation(c) || c == u8'.';
}

/// @brief Returns `true` if the code unit `c` can appear in an unquoted attribute value.
/// Every code unit of a multi-byte code point can.
[[nodiscard]]
constexpr bool is_unquoted_attribute_value(char8_t c)
{
    return !is_declaration_whitespace(c) && c != u8'.' && c != u8':';
}

} // namespace lamp

#endif
