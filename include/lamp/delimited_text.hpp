#ifndef LAMP_DELIMITED_TEXT_HPP
#define LAMP_DELIMITED_TEXT_HPP

#include <array>
#include <cstddef>
#include <string_view>

#include "lamp/util/assert.hpp"
#include "lamp/util/chars.hpp"

#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief A set of ASCII characters which interrupt a scan of literal text
/// because they may start a nested construct.
struct Trigger_Set {
private:
    std::array<bool, 128> m_contained {};

public:
    [[nodiscard]]
    constexpr Trigger_Set() = default;

    [[nodiscard]]
    constexpr explicit Trigger_Set(std::u8string_view chars)
    {
        for (const char8_t c : chars) {
            insert(c);
        }
    }

    constexpr void insert(char8_t c)
    {
        LAMP_ASSERT(is_ascii(c));
        m_contained[c] = true;
    }

    [[nodiscard]]
    constexpr bool contains(char8_t c) const
    {
        return is_ascii(c) && m_contained[c];
    }
};

/// @brief The condition which ends a scan of literal text.
struct Text_Delimiter {
    /// @brief The text which terminates the scan.
    /// If empty, the scan is terminated only by the end of the input.
    std::u8string_view end;
    /// @brief If `true`, the end of the input also terminates the scan successfully
    /// when `end` is not empty.
    bool accept_eof = false;
    /// @brief If `true`, `end` is not consumed,
    /// i.e. the scan continues at the delimiter rather than after it.
    bool keep_delimiter = false;
    /// @brief If `true`, the scan fails when the terminated text is empty.
    bool non_empty = false;
    /// @brief ASCII characters which make the scan fail when encountered in the text.
    std::u8string_view fail_on;
};

enum struct Delimiter_Kind : bool {
    /// @brief The text was terminated by the end condition.
    end,
    /// @brief The text was interrupted by a trigger character.
    trigger,
};

struct Delimited_Text {
    /// @brief The literal text, not including the delimiter or the trigger character.
    std::u8string_view text;
    Delimiter_Kind kind;
    /// @brief The trigger character, if `kind` is `Delimiter_Kind::trigger`.
    char8_t trigger = 0;
};

/// @brief Scans literal text starting at `input` until `delimiter` is satisfied
/// or one of the `triggers` is encountered.
///
/// At every position, the end delimiter is tested before trigger characters.
/// When terminated by a trigger character, the next input is located immediately after that
/// character.
/// When terminated by the end condition, the next input is located after the delimiter,
/// unless `delimiter.keep_delimiter` is `true`.
/// @returns The scanned text, or an error if the end condition cannot be satisfied.
[[nodiscard]]
Parsed<Delimited_Text> scan_delimited_text(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    const Trigger_Set& triggers
);

} // namespace lamp

#endif
