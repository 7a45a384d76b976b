#ifndef LAMP_MARKUP_PARSER_HPP
#define LAMP_MARKUP_PARSER_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "lamp/util/result.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/directive.hpp"
#include "lamp/document.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief Parses the contents of a `{% ... %}` configuration header,
/// which consists of one `key: value` entry per non-blank line.
/// Keys and values are trimmed.
/// If a key occurs more than once, the last value is used.
/// @returns The configuration, or a description of the first malformed line.
[[nodiscard]]
Result<Config, std::pmr::u8string>
parse_config_entries(std::u8string_view text, std::pmr::memory_resource* memory);

/// @brief Parses documents consisting of an optional configuration header,
/// paragraphs, and block directives.
/// Paragraphs may contain escapes, references, and span directives.
///
/// The parser is also used for parsing the bodies of directives,
/// so it must outlive any placeholders in the documents it produces.
struct Markup_Parser final : Recursive_Parsers {
private:
    const Span_Directive_Registry& m_span_directives;
    const Block_Directive_Registry& m_block_directives;
    Parse_Options m_options;
    std::size_t m_depth = 0;

public:
    /// @param options The options for the whole document.
    /// `options.file_name` is used as the path of the document.
    [[nodiscard]]
    Markup_Parser(
        const Span_Directive_Registry& span_directives,
        const Block_Directive_Registry& block_directives,
        const Parse_Options& options
    )
        : m_span_directives { span_directives }
        , m_block_directives { block_directives }
        , m_options { options }
    {
    }

    Markup_Parser(const Markup_Parser&) = delete;
    Markup_Parser& operator=(const Markup_Parser&) = delete;

    [[nodiscard]]
    Document parse_document(std::u8string_view source);

    [[nodiscard]]
    std::pmr::vector<ast::Span>
    parse_spans(std::u8string_view source, const Source_Span& origin) final;

    [[nodiscard]]
    std::pmr::vector<ast::Block>
    parse_blocks(std::u8string_view source, const Source_Span& origin) final;

private:
    [[nodiscard]]
    std::pmr::vector<ast::Span> parse_paragraph(const Parse_Input& input);

    [[nodiscard]]
    std::pmr::vector<ast::Block> parse_block_sequence(const Parse_Input& input);
};

} // namespace lamp

#endif
