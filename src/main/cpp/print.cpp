#include <algorithm>
#include <charconv>
#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "lamp/util/ansi.hpp"
#include "lamp/util/assert.hpp"
#include "lamp/util/io.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/ast.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/print.hpp"

namespace lamp {

namespace {

[[nodiscard]]
std::u8string_view severity_ansi_sequence(Severity severity)
{
    if (severity >= Severity::error) {
        return ansi::h_red;
    }
    if (severity >= Severity::soft_warning) {
        return ansi::h_yellow;
    }
    return ansi::reset;
}

/// @brief Appends `text`, enclosed in `color` and `ansi::reset` if `colors` is `true`.
void append_colored(
    std::pmr::u8string& out,
    std::u8string_view text,
    std::u8string_view color,
    bool colors
)
{
    if (colors) {
        out += color;
    }
    out += text;
    if (colors) {
        out += ansi::reset;
    }
}

void append_integer(std::pmr::u8string& out, std::size_t x)
{
    char buffer[24];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), x);
    LAMP_ASSERT(result.ec == std::errc {});
    out += as_u8string_view(std::string_view { buffer, result.ptr });
}

void append_quoted(std::pmr::u8string& out, std::u8string_view str)
{
    static constexpr char8_t hex_digits[] = u8"0123456789abcdef";

    out += u8'"';
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\t': out += u8"\\t"; break;
        case u8'\r': out += u8"\\r"; break;
        default: {
            if (c < 0x20 || c == 0x7f) {
                out += u8"\\x";
                out += hex_digits[c >> 4];
                out += hex_digits[c & 0xf];
            }
            else {
                out += c;
            }
            break;
        }
        }
    }
    out += u8'"';
}

void dump_span(std::pmr::u8string& out, const ast::Span& span);

void dump_block(std::pmr::u8string& out, const ast::Block& block);

void dump_span(std::pmr::u8string& out, const ast::Span& span)
{
    if (const ast::Text* const text = span.try_as_text()) {
        out += u8"Text(";
        append_quoted(out, text->text);
        out += u8')';
    }
    else if (const ast::Reference* const reference = span.try_as_reference()) {
        out += u8"Reference(";
        out += reference->name;
        out += u8')';
    }
    else if (const ast::Styled* const styled = span.try_as_styled()) {
        out += u8"Styled(";
        out += styled->style;
        out += u8")[";
        dump_spans(out, styled->content);
        out += u8']';
    }
    else if (const ast::Invalid_Span* const invalid = span.try_as_invalid()) {
        out += u8"Invalid_Span(";
        append_quoted(out, invalid->message);
        out += u8", ";
        append_quoted(out, invalid->fallback);
        out += u8')';
    }
    else if (span.try_as_placeholder()) {
        out += u8"Span_Placeholder";
    }
    else {
        LAMP_ASSERT_UNREACHABLE(u8"Retractions never appear in a span sequence.");
    }
}

void dump_block(std::pmr::u8string& out, const ast::Block& block)
{
    if (const ast::Paragraph* const paragraph = block.try_as_paragraph()) {
        out += u8"Paragraph[";
        dump_spans(out, paragraph->content);
        out += u8']';
    }
    else if (const ast::Literal_Block* const literal = block.try_as_literal()) {
        out += u8"Literal_Block(";
        append_quoted(out, literal->text);
        out += u8')';
    }
    else if (const ast::Block_Sequence* const sequence = block.try_as_sequence()) {
        out += u8"Block_Sequence(";
        out += sequence->style;
        out += u8")[";
        for (std::size_t i = 0; i < sequence->content.size(); ++i) {
            if (i != 0) {
                out += u8", ";
            }
            dump_block(out, sequence->content[i]);
        }
        out += u8']';
    }
    else if (const ast::Invalid_Block* const invalid = block.try_as_invalid()) {
        out += u8"Invalid_Block(";
        append_quoted(out, invalid->message);
        out += u8", ";
        append_quoted(out, invalid->fallback);
        out += u8')';
    }
    else {
        LAMP_ASSERT(block.try_as_placeholder());
        out += u8"Block_Placeholder";
    }
}

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    LAMP_ASSERT(index <= source.size());

    // A position at a line break or at the end of the source belongs to the line it ends.
    const std::size_t previous
        = index == 0 ? std::u8string_view::npos : source.rfind(u8'\n', index - 1);
    const std::size_t begin = previous == std::u8string_view::npos ? 0 : previous + 1;
    const std::size_t end = std::min(source.find(u8'\n', index), source.size());
    return source.substr(begin, end - begin);
}

void print_file_position(
    std::pmr::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors
)
{
    if (colors) {
        out += ansi::h_black;
    }
    out += file;
    out += u8':';
    append_integer(out, pos.line + 1);
    out += u8':';
    append_integer(out, pos.column + 1);
    out += u8':';
    if (colors) {
        out += ansi::reset;
    }
}

void print_affected_line(
    std::pmr::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
)
{
    constexpr std::size_t pad_max = 6;

    const std::u8string_view cited_code = find_line(source, pos.begin);

    std::pmr::u8string line_number { out.get_allocator() };
    append_integer(line_number, pos.line + 1);
    out.append(pad_max - std::min(line_number.size(), pad_max - 1), u8' ');
    append_colored(out, line_number, ansi::h_yellow, colors);
    out += u8" | ";
    out += cited_code;
    out += u8'\n';

    out.append(std::max(pad_max, line_number.size() + 1), u8' ');
    out += u8" | ";
    out.append(pos.column, u8' ');

    const std::size_t available = cited_code.size() > pos.column ? cited_code.size() - pos.column : 0;
    const std::size_t indicator_length = std::min(std::max(pos.length, std::size_t { 1 }), available);
    std::pmr::u8string indicator { u8"^", out.get_allocator() };
    if (indicator_length > 1) {
        indicator.append(indicator_length - 1, u8'~');
    }
    append_colored(out, indicator, ansi::green, colors);
    out += u8'\n';
}

void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view source,
    bool colors
)
{
    if (!diagnostic.file.empty()) {
        print_file_position(out, diagnostic.file, diagnostic.location, colors);
        out += u8' ';
    }
    append_colored(
        out, severity_tag(diagnostic.severity), severity_ansi_sequence(diagnostic.severity), colors
    );
    out += u8": ";
    out += diagnostic.message;
    out += u8' ';
    append_colored(out, u8"[", ansi::h_black, colors);
    append_colored(out, diagnostic.id, ansi::h_black, colors);
    append_colored(out, u8"]", ansi::h_black, colors);
    out += u8'\n';

    if (!source.empty() && !diagnostic.location.empty()
        && diagnostic.location.begin <= source.size()) {
        print_affected_line(out, source, diagnostic.location, colors);
    }
}

void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors
)
{
    if (colors) {
        out += ansi::h_black;
    }
    out += file;
    out += u8':';
    if (colors) {
        out += ansi::reset;
    }
    out += u8' ';
    append_colored(out, severity_tag(Severity::error), ansi::h_red, colors);
    out += u8": ";
    out += io_error_code_message(error);
    out += u8'\n';
}

void dump_spans(std::pmr::u8string& out, std::span<const ast::Span> spans)
{
    for (std::size_t i = 0; i < spans.size(); ++i) {
        if (i != 0) {
            out += u8", ";
        }
        dump_span(out, spans[i]);
    }
}

void dump_blocks(std::pmr::u8string& out, std::span<const ast::Block> blocks)
{
    for (const ast::Block& block : blocks) {
        dump_block(out, block);
        out += u8'\n';
    }
}

void dump_document(std::pmr::u8string& out, const Document& document)
{
    out += u8"Document(";
    append_quoted(out, document.path);
    out += u8")\n";
    for (const auto& [key, value] : document.config) {
        out += u8"Config(";
        out += key;
        out += u8") = ";
        append_quoted(out, value);
        out += u8'\n';
    }
    dump_blocks(out, document.content);
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

} // namespace lamp
