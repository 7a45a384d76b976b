#ifndef LAMP_MARKUP_DIRECTIVES_HPP
#define LAMP_MARKUP_DIRECTIVES_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/directive.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief Parses the name in a reference such as `{{ config.title }}`.
/// `input` shall be located after the first `{`,
/// which is the trigger character that led to this parser.
[[nodiscard]]
Parsed<std::u8string_view> parse_reference_name(const Parse_Input& input);

/// @brief Parses a reference such as `{{title}}` into an `ast::Reference`.
/// `input` shall be located after the first `{`.
[[nodiscard]]
Parsed<ast::Span>
parse_reference(const Parse_Input& input, std::pmr::memory_resource* memory);

/// @brief Parses the body of a span or template directive,
/// which is optional whitespace, followed by text in braces.
/// Braces within the body are balanced, up to `max_depth` levels deep,
/// and references like `{{name}}` within the body are skipped as a whole.
/// @returns The raw text between the outermost braces.
[[nodiscard]]
Parsed<std::pmr::u8string> parse_brace_body(
    const Parse_Input& input,
    std::size_t max_depth,
    std::pmr::memory_resource* memory
);

/// @brief Parses the body of a block directive,
/// which is the rest of the current line,
/// followed by any lines that are blank or indented.
/// The common indentation of the following lines is removed,
/// and the result is trimmed.
/// Trailing blank lines are not part of the body.
/// An empty body is an error.
[[nodiscard]]
Parsed<std::pmr::u8string>
parse_indented_body(const Parse_Input& input, std::pmr::memory_resource* memory);

/// @brief Parses a span or template directive such as `@:style strong: { text }`
/// and applies it.
/// `input` shall be located after the `@`,
/// which is the trigger character that led to this parser.
[[nodiscard]]
Parsed<ast::Span> parse_span_directive(
    const Parse_Input& input,
    const Span_Directive_Registry& registry,
    const Directive_Kind<Span_Directive_Context, ast::Span>& kind,
    Recursive_Span_Parser& parser,
    const Parse_Options& options
);

/// @brief Parses a block directive such as `@:box: text` and applies it.
/// The directive has to be followed by the end of the line or the end of the input.
[[nodiscard]]
Parsed<ast::Block> parse_block_directive(
    const Parse_Input& input,
    const Block_Directive_Registry& registry,
    Recursive_Parsers& parsers,
    const Parse_Options& options
);

/// @brief Returns `true` if the body of the directive at `origin` may be parsed
/// recursively at nesting level `depth`.
/// Otherwise, logs that the body is kept as text.
[[nodiscard]]
bool may_enter_body(std::size_t depth, const Source_Span& origin, const Parse_Options& options);

/// @brief Parses templates, which consist of literal text, references, and template
/// directives.
/// Directive bodies are parsed recursively as templates.
struct Template_Parser final : Recursive_Span_Parser {
private:
    const Span_Directive_Registry& m_directives;
    Parse_Options m_options;
    std::size_t m_depth = 0;

public:
    /// @param directives The template directives.
    /// These must outlive any placeholders produced by this parser,
    /// as must the parser itself.
    [[nodiscard]]
    Template_Parser(const Span_Directive_Registry& directives, const Parse_Options& options)
        : m_directives { directives }
        , m_options { options }
    {
    }

    Template_Parser(const Template_Parser&) = delete;
    Template_Parser& operator=(const Template_Parser&) = delete;

    [[nodiscard]]
    std::pmr::vector<ast::Span> parse_template(std::u8string_view source);

    [[nodiscard]]
    std::pmr::vector<ast::Span>
    parse_spans(std::u8string_view source, const Source_Span& origin) final;
};

} // namespace lamp

#endif
