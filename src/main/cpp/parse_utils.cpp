#include <cstddef>
#include <string_view>

#include "lamp/util/assert.hpp"
#include "lamp/util/chars.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/fwd.hpp"
#include "lamp/parse_utils.hpp"

namespace lamp {

Blank_Line find_blank_line_sequence // NOLINT(bugprone-exception-escape)
    (std::u8string_view str) noexcept
{
    enum struct State : Default_Underlying {
        /// @brief We are at the start of a line.
        maybe_blank,
        /// @brief There are non-blank characters on this line.
        not_blank,
        /// @brief At least one line is blank.
        blank,
    };
    State state = State::maybe_blank;

    std::size_t blank_begin = 0;
    std::size_t blank_end = 0;

    for (std::size_t i = 0; i < str.size(); ++i) {
        const char8_t c = str[i];
        switch (state) {
        case State::maybe_blank: {
            if (c == u8'\n') {
                state = State::blank;
                blank_end = i + 1;
            }
            else if (!is_ascii_blank(c)) {
                state = State::not_blank;
            }
            continue;
        }
        case State::not_blank: {
            if (c == u8'\n') {
                state = State::maybe_blank;
                blank_begin = i + 1;
            }
            continue;
        }
        case State::blank: {
            if (c == u8'\n') {
                blank_end = i + 1;
            }
            else if (!is_ascii_blank(c)) {
                return { .begin = blank_begin, .length = blank_end - blank_begin };
            }
            continue;
        }
        }
        LAMP_ASSERT_UNREACHABLE(u8"Invalid state");
    }

    static_assert(!Blank_Line {}, "A value-initialized Blank_Line should be falsy");
    if (state == State::blank || (state == State::maybe_blank && blank_begin < str.size())) {
        return { .begin = blank_begin, .length = str.size() - blank_begin };
    }
    return {};
}

std::size_t length_leading_blank_lines(std::u8string_view str) noexcept
{
    std::size_t result = 0;
    while (result < str.size()) {
        const std::u8string_view rest = str.substr(result);
        const std::size_t length = line_length(rest);
        if (!is_ascii_blank(rest.substr(0, length))) {
            return result;
        }
        result += length == rest.size() ? length : length + 1;
    }
    return result;
}

} // namespace lamp
