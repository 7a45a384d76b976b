#ifndef LAMP_INLINE_PARSING_HPP
#define LAMP_INLINE_PARSING_HPP

#include <concepts>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/assert.hpp"

#include "lamp/ast.hpp"
#include "lamp/delimited_text.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief Accumulates the results of an inline parse.
/// Literal text is converted into an element with `from_string`,
/// every element is passed to `append` in input order,
/// and the final result is obtained with `std::move(builder).result()`.
template <typename B>
concept Result_Builder = requires(B& b, std::u8string_view str) {
    typename B::element_type;
    typename B::result_type;
    { b.from_string(str) } -> std::same_as<typename B::element_type>;
    b.append(b.from_string(str));
    { std::move(b).result() } -> std::same_as<typename B::result_type>;
};

/// @brief Associates a trigger character with the parser for the construct it starts.
/// The parser is run immediately after the trigger character.
template <typename Element>
struct Trigger {
    char8_t c;
    Parser_Ref<Element> parser;
};

/// @brief Builds a sequence of spans.
/// Adjacent text is always merged,
/// so the result never contains two consecutive `ast::Text` elements.
/// `ast::Retraction` elements are interpreted, not stored.
struct Span_Builder {
    using element_type = ast::Span;
    using result_type = std::pmr::vector<ast::Span>;

private:
    std::pmr::vector<ast::Span> m_output;
    std::optional<ast::Span> m_pending;

public:
    [[nodiscard]]
    explicit Span_Builder(std::pmr::memory_resource* memory)
        : m_output { memory }
    {
    }

    [[nodiscard]]
    ast::Span from_string(std::u8string_view str) const
    {
        return ast::make_text(str, m_output.get_allocator().resource());
    }

    void append(ast::Span&& item);

    [[nodiscard]]
    result_type result() &&;

private:
    void flush();
};

/// @brief Builds a single string from all appended pieces of text.
/// The pieces are copied immediately,
/// so they only need to remain valid for the duration of `append`.
struct Text_Builder {
    using element_type = std::u8string_view;
    using result_type = std::pmr::u8string;

private:
    std::pmr::u8string m_text;

public:
    [[nodiscard]]
    explicit Text_Builder(std::pmr::memory_resource* memory)
        : m_text { memory }
    {
    }

    [[nodiscard]]
    std::u8string_view from_string(std::u8string_view str) const
    {
        return str;
    }

    void append(std::u8string_view str)
    {
        m_text += str;
    }

    [[nodiscard]]
    result_type result() &&
    {
        return std::move(m_text);
    }
};

static_assert(Result_Builder<Span_Builder>);
static_assert(Result_Builder<Text_Builder>);

/// @brief Parses text which may contain nested constructs, up to the given `delimiter`.
///
/// Literal text is scanned up to the delimiter or the next trigger character in `nested`.
/// When a trigger character is found,
/// the corresponding parser is run immediately after that character.
/// If it succeeds, its element is appended and parsing resumes where it stopped.
/// If it fails, the trigger character is appended as literal text and parsing resumes right
/// after it, so no parser is tried twice at the same position.
/// If the delimiter cannot be found, the result is an error located at `input`.
/// @param nested The nested parsers.
/// If multiple parsers have the same trigger character, the first one is used.
/// @param builder A fresh builder which is used exclusively by this call.
template <Result_Builder Builder>
[[nodiscard]]
Parsed<typename Builder::result_type> parse_inline(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::span<const Trigger<typename Builder::element_type>> nested,
    Builder builder
)
{
    Trigger_Set triggers;
    for (const auto& trigger : nested) {
        triggers.insert(trigger.c);
    }
    const auto parser_for = [&](char8_t c) -> Parser_Ref<typename Builder::element_type> {
        for (const auto& trigger : nested) {
            if (trigger.c == c) {
                return trigger.parser;
            }
        }
        LAMP_ASSERT_UNREACHABLE(u8"Trigger character without parser.");
    };

    Parse_Input current = input;
    while (true) {
        Parsed<Delimited_Text> scanned = scan_delimited_text(current, delimiter, triggers);
        if (!scanned) {
            return Parse_Error { scanned.error().message, input.pos };
        }
        const Delimited_Text& text = scanned->value;
        if (!text.text.empty()) {
            builder.append(builder.from_string(text.text));
        }
        if (text.kind == Delimiter_Kind::end) {
            return Parse_Success<typename Builder::result_type> {
                .value = std::move(builder).result(),
                .next = scanned->next,
            };
        }

        const Parse_Input after_trigger = scanned->next;
        auto element = parser_for(text.trigger)(after_trigger);
        if (element) {
            LAMP_ASSERT(element->next.pos.begin >= after_trigger.pos.begin);
            builder.append(std::move(element->value));
            current = element->next;
        }
        else {
            const std::u8string_view trigger_text
                = after_trigger.source.substr(after_trigger.pos.begin - 1, 1);
            builder.append(builder.from_string(trigger_text));
            current = after_trigger;
        }
    }
}

/// @brief Parses spans up to `delimiter` using `Span_Builder`.
[[nodiscard]]
inline Parsed<std::pmr::vector<ast::Span>> parse_spans(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::span<const Trigger<ast::Span>> nested,
    std::pmr::memory_resource* memory
)
{
    return parse_inline(input, delimiter, nested, Span_Builder { memory });
}

/// @brief Parses text up to `delimiter` using `Text_Builder`.
[[nodiscard]]
inline Parsed<std::pmr::u8string> parse_text(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::span<const Trigger<std::u8string_view>> nested,
    std::pmr::memory_resource* memory
)
{
    return parse_inline(input, delimiter, nested, Text_Builder { memory });
}

/// @brief Parses a single code point, which is the escaped character following a backslash.
/// An ill-formed code unit sequence is treated as a single code point.
[[nodiscard]]
Parsed<std::u8string_view> parse_escaped_code_point(const Parse_Input& input);

/// @brief Parses text up to `delimiter`, where a backslash escapes the code point that follows
/// it.
/// The escaped code point is part of the result, but the backslash is not.
/// A backslash at the end of the input is literal.
[[nodiscard]]
Parsed<std::pmr::u8string> parse_escaped_text(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::pmr::memory_resource* memory
);

} // namespace lamp

#endif
