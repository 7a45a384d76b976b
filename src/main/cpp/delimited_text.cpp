#include <cstddef>
#include <string_view>

#include "lamp/delimited_text.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

namespace {

[[nodiscard]]
Parsed<Delimited_Text> finish_at_end(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::size_t length,
    std::size_t delimiter_length
)
{
    if (delimiter.non_empty && length == 0) {
        return Parse_Error { u8"Expected at least one character before the delimiter.",
                             input.pos };
    }
    const std::u8string_view text = input.remaining().substr(0, length);
    const std::size_t consumed = delimiter.keep_delimiter ? length : length + delimiter_length;
    return Parse_Success<Delimited_Text> {
        .value = { .text = text, .kind = Delimiter_Kind::end },
        .next = input.advanced(consumed),
    };
}

} // namespace

Parsed<Delimited_Text> scan_delimited_text(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    const Trigger_Set& triggers
)
{
    const std::u8string_view remaining = input.remaining();

    for (std::size_t i = 0; i < remaining.size(); ++i) {
        if (!delimiter.end.empty() && remaining.substr(i).starts_with(delimiter.end)) {
            return finish_at_end(input, delimiter, i, delimiter.end.size());
        }
        const char8_t c = remaining[i];
        if (delimiter.fail_on.contains(c)) {
            return Parse_Error { u8"Unexpected character in delimited text.",
                                 input.advanced(i).pos };
        }
        if (triggers.contains(c)) {
            return Parse_Success<Delimited_Text> {
                .value = { .text = remaining.substr(0, i),
                           .kind = Delimiter_Kind::trigger,
                           .trigger = c },
                .next = input.advanced(i + 1),
            };
        }
    }

    if (delimiter.end.empty() || delimiter.accept_eof) {
        return finish_at_end(input, delimiter, remaining.size(), 0);
    }
    return Parse_Error { u8"Unexpected end of input; the delimiter was never found.",
                         input.advanced(remaining.size()).pos };
}

} // namespace lamp
