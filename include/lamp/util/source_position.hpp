#ifndef LAMP_SOURCE_POSITION_HPP
#define LAMP_SOURCE_POSITION_HPP

#include <cstddef>
#include <string_view>

#include "lamp/util/assert.hpp"

#include "lamp/fwd.hpp"

namespace lamp {

/// Represents a position in a source file.
struct Source_Position {
    /// Line number.
    std::size_t line;
    /// Column number.
    std::size_t column;
    /// First index in the source file that is part of the syntactical element.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;
};

constexpr void advance(Source_Position& pos, char8_t c)
{
    switch (c) {
    case '\r': pos.column = 0; break;
    case '\n':
        pos.column = 0;
        pos.line += 1;
        break;
    default: pos.column += 1;
    }
    pos.begin += 1;
}

constexpr void advance(Source_Position& pos, std::u8string_view str)
{
    for (const char8_t c : str) {
        advance(pos, c);
    }
}

/// Represents a span of characters in a source file.
struct Source_Span : Source_Position {
    std::size_t length;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Span, Source_Span)
        = default;

    /// @brief Returns the span that begins at `first` and ends at `last`.
    /// `last` shall not precede `first`.
    [[nodiscard]]
    static constexpr Source_Span between(Source_Position first, Source_Position last)
    {
        LAMP_ASSERT(last.begin >= first.begin);
        return { first, last.begin - first.begin };
    }

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }
};

} // namespace lamp

#endif
