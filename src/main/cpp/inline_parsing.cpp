#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/function_ref.hpp"
#include "lamp/util/unicode.hpp"

#include "lamp/ast.hpp"
#include "lamp/inline_parsing.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

void Span_Builder::append(ast::Span&& item)
{
    if (ast::Retraction* const retraction = item.try_as_retraction()) {
        ast::Text* const pending_text = m_pending ? m_pending->try_as_text() : nullptr;
        const std::size_t drop_units = pending_text
            ? utf8::length_trailing_code_points(pending_text->text, retraction->drop_length)
            : std::u8string_view::npos;
        const bool can_retract = drop_units != std::u8string_view::npos;
        if (can_retract) {
            pending_text->text.resize(pending_text->text.size() - drop_units);
            if (pending_text->text.empty()) {
                m_pending.reset();
            }
        }
        std::pmr::vector<ast::Span> spans
            = std::move(can_retract ? retraction->replacement : retraction->fallback);
        for (ast::Span& span : spans) {
            append(std::move(span));
        }
        return;
    }

    if (const ast::Text* const text = item.try_as_text()) {
        if (text->text.empty()) {
            return;
        }
        if (ast::Text* const pending_text = m_pending ? m_pending->try_as_text() : nullptr) {
            pending_text->text += text->text;
            return;
        }
    }

    flush();
    m_pending.emplace(std::move(item));
}

Span_Builder::result_type Span_Builder::result() &&
{
    flush();
    return std::move(m_output);
}

void Span_Builder::flush()
{
    if (m_pending) {
        m_output.push_back(std::move(*m_pending));
        m_pending.reset();
    }
}

Parsed<std::u8string_view> parse_escaped_code_point(const Parse_Input& input)
{
    if (input.eof()) {
        return Parse_Error { u8"Expected a character after the backslash.", input.pos };
    }
    const std::size_t length = utf8::leading_code_point_length(input.remaining());
    const Parse_Input next = input.advanced(length);
    return Parse_Success<std::u8string_view> { .value = input.capture(next), .next = next };
}

Parsed<std::pmr::u8string> parse_escaped_text(
    const Parse_Input& input,
    const Text_Delimiter& delimiter,
    std::pmr::memory_resource* memory
)
{
    const Trigger<std::u8string_view> escape[] {
        { u8'\\', const_v<&parse_escaped_code_point> },
    };
    return parse_text(input, delimiter, escape, memory);
}

} // namespace lamp
