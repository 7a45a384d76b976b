#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/assert.hpp"
#include "lamp/util/function_ref.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/ast.hpp"
#include "lamp/delimited_text.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/directive.hpp"
#include "lamp/document.hpp"
#include "lamp/inline_parsing.hpp"
#include "lamp/markup_directives.hpp"
#include "lamp/markup_parser.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/parse_utils.hpp"

namespace lamp {

namespace {

constexpr std::u8string_view config_header_open = u8"{%";
constexpr std::u8string_view config_header_close = u8"%}";

} // namespace

Result<Config, std::pmr::u8string>
parse_config_entries(std::u8string_view text, std::pmr::memory_resource* memory)
{
    Config result { memory };
    while (!text.empty()) {
        const std::size_t length = line_length(text);
        const std::u8string_view line = trim_ascii_blank(text.substr(0, length));
        text.remove_prefix(length == text.size() ? length : length + 1);
        if (line.empty()) {
            continue;
        }

        const std::size_t colon = line.find(u8':');
        if (colon == std::u8string_view::npos) {
            std::pmr::u8string error { u8"Expected 'key: value', but found: ", memory };
            error += line;
            return error;
        }
        const std::u8string_view key = trim_ascii_blank_right(line.substr(0, colon));
        if (key.empty()) {
            std::pmr::u8string error { u8"Missing key before ':' in: ", memory };
            error += line;
            return error;
        }
        const std::u8string_view value = trim_ascii_blank_left(line.substr(colon + 1));
        result.insert_or_assign(
            std::pmr::u8string { key, memory }, std::pmr::u8string { value, memory }
        );
    }
    return result;
}

Document Markup_Parser::parse_document(std::u8string_view source)
{
    std::pmr::memory_resource* const memory = m_options.memory;
    Document result {
        .path = std::pmr::u8string { m_options.file_name, memory },
        .config = Config { memory },
        .content = std::pmr::vector<ast::Block> { memory },
    };

    Parse_Input input { source };
    if (source.starts_with(config_header_open)) {
        const std::size_t close = source.find(config_header_close, config_header_open.size());
        // An unterminated header is simply text.
        if (close != std::u8string_view::npos) {
            const std::u8string_view header_text
                = source.substr(config_header_open.size(), close - config_header_open.size());
            const std::size_t header_length = close + config_header_close.size();

            Result<Config, std::pmr::u8string> config = parse_config_entries(header_text, memory);
            if (config) {
                result.config = std::move(*config);
            }
            else {
                std::pmr::u8string message { u8"Error parsing config header: ", memory };
                message += config.error();
                m_options.logger.log(
                    Diagnostic {
                        .severity = Severity::error,
                        .id = diagnostic::config_header,
                        .file = m_options.file_name,
                        .location = input.span_to(input.advanced(header_length)),
                        .message = message,
                    }
                );
                result.content.push_back(
                    ast::make_invalid_block(message, source.substr(0, header_length), memory)
                );
            }
            input = input.advanced(header_length);
        }
    }

    std::pmr::vector<ast::Block> blocks = parse_block_sequence(input);
    for (ast::Block& block : blocks) {
        result.content.push_back(std::move(block));
    }
    return result;
}

std::pmr::vector<ast::Span>
Markup_Parser::parse_spans(std::u8string_view source, const Source_Span& origin)
{
    if (!may_enter_body(m_depth, origin, m_options)) {
        std::pmr::vector<ast::Span> result { m_options.memory };
        result.push_back(ast::make_text(source, m_options.memory));
        return result;
    }
    const Nested_Body_Scope scope { m_depth, m_options, origin };
    return parse_paragraph(Parse_Input { source });
}

std::pmr::vector<ast::Block>
Markup_Parser::parse_blocks(std::u8string_view source, const Source_Span& origin)
{
    if (!may_enter_body(m_depth, origin, m_options)) {
        std::pmr::vector<ast::Block> result { m_options.memory };
        result.push_back(ast::make_literal_block(source, m_options.memory));
        return result;
    }
    const Nested_Body_Scope scope { m_depth, m_options, origin };
    return parse_block_sequence(Parse_Input { source });
}

std::pmr::vector<ast::Span> Markup_Parser::parse_paragraph(const Parse_Input& input)
{
    const auto escape = [&](const Parse_Input& in) -> Parsed<ast::Span> {
        Parsed<std::u8string_view> escaped = parse_escaped_code_point(in);
        if (!escaped) {
            return escaped.error();
        }
        return Parse_Success<ast::Span> { .value = ast::make_text(escaped->value, m_options.memory),
                                          .next = escaped->next };
    };
    const auto reference = [&](const Parse_Input& in) { //
        return parse_reference(in, m_options.memory);
    };
    const auto directive = [&](const Parse_Input& in) {
        return parse_span_directive(
            in, m_span_directives, span_directive_kind, *this, m_options
        );
    };
    const Trigger<ast::Span> triggers[] {
        { u8'\\', escape },
        { u8'{', reference },
        { u8'@', directive },
    };
    Parsed<std::pmr::vector<ast::Span>> result
        = lamp::parse_spans(input, Text_Delimiter {}, triggers, m_options.memory);
    // Without an end delimiter, the end of the input always terminates successfully.
    LAMP_ASSERT(result);
    return std::move(result->value);
}

std::pmr::vector<ast::Block> Markup_Parser::parse_block_sequence(const Parse_Input& input)
{
    std::pmr::vector<ast::Block> result { m_options.memory };

    Parse_Input current = input;
    while (true) {
        current = current.advanced(length_leading_blank_lines(current.remaining()));
        if (current.eof()) {
            return result;
        }

        if (current.remaining().starts_with(u8"@:")) {
            Parsed<ast::Block> directive
                = parse_block_directive(current, m_block_directives, *this, m_options);
            if (directive) {
                result.push_back(std::move(directive->value));
                current = directive->next;
                continue;
            }
        }

        const std::u8string_view rest = current.remaining();
        const Blank_Line blank = find_blank_line_sequence(rest);
        std::size_t paragraph_length = blank ? blank.begin : rest.size();
        if (paragraph_length != 0 && rest[paragraph_length - 1] == u8'\n') {
            --paragraph_length;
        }
        LAMP_ASSERT(paragraph_length != 0);

        result.push_back(ast::Paragraph {
            parse_paragraph(current.truncated(current.pos.begin + paragraph_length)) });
        current = current.advanced(blank ? blank.begin + blank.length : rest.size());
    }
}

} // namespace lamp
