#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/assert.hpp"
#include "lamp/util/chars.hpp"
#include "lamp/util/function_ref.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/ast.hpp"
#include "lamp/delimited_text.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/directive.hpp"
#include "lamp/directive_application.hpp"
#include "lamp/directive_parsing.hpp"
#include "lamp/inline_parsing.hpp"
#include "lamp/markup_directives.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/parse_utils.hpp"
#include "lamp/parser.hpp"
#include "lamp/settings.hpp"

namespace lamp {

namespace {

/// @brief Parses the text after an opening brace, up to the matching closing brace.
/// The result is the text in between.
[[nodiscard]]
Parsed<std::pmr::u8string> parse_brace_content(
    const Parse_Input& input,
    std::size_t depth_left,
    std::pmr::memory_resource* memory
)
{
    // Nested constructs produce their raw source text,
    // so the built text is identical to the source between the braces.
    const auto reference_or_nested_braces
        = [&](const Parse_Input& after_brace) -> Parsed<std::u8string_view> {
        // The trigger character is the opening brace immediately before after_brace.
        const auto with_brace = [&](const Parse_Input& next) {
            const std::size_t begin = after_brace.pos.begin - 1;
            return after_brace.source.substr(begin, next.pos.begin - begin);
        };
        if (Parsed<std::u8string_view> name = parse_reference_name(after_brace)) {
            return Parse_Success<std::u8string_view> { .value = with_brace(name->next),
                                                       .next = name->next };
        }
        if (depth_left == 0) {
            return Parse_Error { u8"Braces are nested too deeply.", after_brace.pos };
        }
        Parsed<std::pmr::u8string> nested = parse_brace_content(after_brace, depth_left - 1, memory);
        if (!nested) {
            return nested.error();
        }
        return Parse_Success<std::u8string_view> { .value = with_brace(nested->next),
                                                   .next = nested->next };
    };
    const Trigger<std::u8string_view> triggers[] {
        { u8'{', reference_or_nested_braces },
    };
    return parse_text(input, Text_Delimiter { .end = u8"}" }, triggers, memory);
}

} // namespace

Parsed<std::u8string_view> parse_reference_name(const Parse_Input& input)
{
    Parser p { input };
    if (!p.expect(u8'{')) {
        return p.error(u8"Expected '{{' at the start of a reference.");
    }
    p.match_while(is_indentation);
    if (!p.peek(is_name_start)) {
        return p.error(u8"Expected a name in a reference.");
    }
    const std::u8string_view name = p.match_while(is_reference_name_continuation);
    p.match_while(is_indentation);
    if (!p.expect(u8"}}")) {
        return p.error(u8"Expected '}}' at the end of a reference.");
    }
    return Parse_Success<std::u8string_view> { .value = name, .next = p.input() };
}

Parsed<ast::Span> parse_reference(const Parse_Input& input, std::pmr::memory_resource* memory)
{
    Parsed<std::u8string_view> name = parse_reference_name(input);
    if (!name) {
        return name.error();
    }
    return Parse_Success<ast::Span> { .value = ast::make_reference(name->value, memory),
                                      .next = name->next };
}

Parsed<std::pmr::u8string> parse_brace_body(
    const Parse_Input& input,
    std::size_t max_depth,
    std::pmr::memory_resource* memory
)
{
    Parser p { input };
    p.match_while(is_declaration_whitespace);
    if (!p.expect(u8'{')) {
        return p.error(u8"Expected '{' at the start of a directive body.");
    }
    return parse_brace_content(p.input(), max_depth, memory);
}

Parsed<std::pmr::u8string>
parse_indented_body(const Parse_Input& input, std::pmr::memory_resource* memory)
{
    const std::u8string_view rest = input.remaining();
    const std::size_t first_line_end = line_length(rest);

    // The body ends after the last non-blank line that is indented sufficiently.
    std::size_t body_end = first_line_end;
    std::size_t common_indentation = std::u8string_view::npos;
    for (std::size_t pos = first_line_end; pos < rest.size();) {
        const std::size_t line_begin = pos + 1;
        const std::u8string_view line = rest.substr(line_begin, line_length(rest.substr(line_begin)));
        pos = line_begin + line.size();
        if (is_ascii_blank(line)) {
            continue;
        }
        const std::size_t indentation = length_indentation(line);
        if (indentation < min_block_body_indentation) {
            break;
        }
        common_indentation = std::min(common_indentation, indentation);
        body_end = pos;
    }

    std::pmr::u8string body { rest.substr(0, first_line_end), memory };
    for (std::size_t pos = first_line_end; pos < body_end;) {
        const std::size_t line_begin = pos + 1;
        const std::u8string_view line = rest.substr(line_begin, line_length(rest.substr(line_begin)));
        pos = line_begin + line.size();
        body += u8'\n';
        if (!is_ascii_blank(line)) {
            body += line.substr(common_indentation);
        }
    }

    const std::u8string_view trimmed = trim_ascii_blank(body);
    if (trimmed.empty()) {
        return Parse_Error { u8"empty body", input.pos };
    }
    return Parse_Success<std::pmr::u8string> {
        .value = std::pmr::u8string { trimmed, memory },
        .next = input.advanced(body_end),
    };
}

Parsed<ast::Span> parse_span_directive(
    const Parse_Input& input,
    const Span_Directive_Registry& registry,
    const Directive_Kind<Span_Directive_Context, ast::Span>& kind,
    Recursive_Span_Parser& parser,
    const Parse_Options& options
)
{
    const auto body = [&](const Parse_Input& in) -> Parsed<std::pmr::u8string> {
        return parse_brace_body(in, options.max_nesting_depth, options.memory);
    };
    Parsed<Parsed_Directive> parsed
        = parse_directive(input, body, Start_Char_Policy::exclude, options.memory);
    if (!parsed) {
        return parsed.error();
    }

    std::pmr::u8string fallback { u8"@", options.memory };
    fallback += input.capture(parsed->next);
    const Directive_Site<Span_Directive_Context> site {
        .parser = parser,
        .fallback = fallback,
        .location = options.body_origin.value_or(input.span_to(parsed->next)),
        .options = options,
    };
    return Parse_Success<ast::Span> {
        .value = apply_directive(std::move(parsed->value), registry, kind, site),
        .next = parsed->next,
    };
}

Parsed<ast::Block> parse_block_directive(
    const Parse_Input& input,
    const Block_Directive_Registry& registry,
    Recursive_Parsers& parsers,
    const Parse_Options& options
)
{
    const auto body = [&](const Parse_Input& in) -> Parsed<std::pmr::u8string> {
        return parse_indented_body(in, options.memory);
    };
    Parsed<Parsed_Directive> parsed
        = parse_directive(input, body, Start_Char_Policy::include, options.memory);
    if (!parsed) {
        return parsed.error();
    }

    Parser rest { parsed->next };
    rest.match_while(is_indentation);
    if (!rest.eof() && !rest.peek(u8'\n')) {
        return rest.error(u8"Expected the end of the line after a block directive.");
    }

    const Directive_Site<Block_Directive_Context> site {
        .parser = parsers,
        .fallback = input.capture(parsed->next),
        .location = options.body_origin.value_or(input.span_to(parsed->next)),
        .options = options,
    };
    return Parse_Success<ast::Block> {
        .value = apply_directive(std::move(parsed->value), registry, block_directive_kind, site),
        .next = rest.input(),
    };
}

bool may_enter_body(std::size_t depth, const Source_Span& origin, const Parse_Options& options)
{
    if (depth < options.max_nesting_depth) {
        return true;
    }
    options.logger.log(
        Diagnostic {
            .severity = Severity::warning,
            .id = diagnostic::nesting_depth,
            .file = options.file_name,
            .location = options.body_origin.value_or(origin),
            .message = u8"Directive bodies are nested too deeply; the body is kept as text.",
        }
    );
    return false;
}

std::pmr::vector<ast::Span> Template_Parser::parse_template(std::u8string_view source)
{
    const auto reference = [&](const Parse_Input& in) { //
        return lamp::parse_reference(in, m_options.memory);
    };
    const auto directive = [&](const Parse_Input& in) {
        return parse_span_directive(in, m_directives, template_directive_kind, *this, m_options);
    };
    const Trigger<ast::Span> triggers[] {
        { u8'{', reference },
        { u8'@', directive },
    };
    Parsed<std::pmr::vector<ast::Span>> result
        = lamp::parse_spans(Parse_Input { source }, Text_Delimiter {}, triggers, m_options.memory);
    // Without an end delimiter, the end of the input always terminates successfully.
    LAMP_ASSERT(result);
    return std::move(result->value);
}

std::pmr::vector<ast::Span>
Template_Parser::parse_spans(std::u8string_view source, const Source_Span& origin)
{
    if (!may_enter_body(m_depth, origin, m_options)) {
        std::pmr::vector<ast::Span> result { m_options.memory };
        result.push_back(ast::make_text(source, m_options.memory));
        return result;
    }
    const Nested_Body_Scope scope { m_depth, m_options, origin };
    return parse_template(source);
}

} // namespace lamp
