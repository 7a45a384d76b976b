#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <variant>

#include <gtest/gtest.h>

#include "lamp/ast.hpp"
#include "lamp/builtin_directive_set.hpp"
#include "lamp/collecting_logger.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/markup_parser.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/settings.hpp"
#include "test_support.hpp"

namespace lamp {
namespace {

struct Markup_Parsing : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Builtin_Directive_Set directives { &memory };

    [[nodiscard]]
    Document parse(std::u8string_view source, std::size_t max_depth = default_max_nesting_depth)
    {
        const Parse_Options options {
            .file_name = u8"test.lamp",
            .logger = logger,
            .max_nesting_depth = max_depth,
            .memory = &memory,
        };
        Markup_Parser parser { directives.span_directives(), directives.block_directives(),
                               options };
        return parser.parse_document(source);
    }
};

TEST(Config_Entries, simple)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto result = parse_config_entries(u8"\n title: My Doc \n\nauthor:Jane\n", &memory);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->find(u8"title")->second, u8"My Doc");
    EXPECT_EQ(result->find(u8"author")->second, u8"Jane");
}

TEST(Config_Entries, value_with_colon)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto result = parse_config_entries(u8"url: https://example.com", &memory);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->find(u8"url")->second, u8"https://example.com");
}

TEST(Config_Entries, last_value_wins)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto result = parse_config_entries(u8"a: 1\na: 2", &memory);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->find(u8"a")->second, u8"2");
}

TEST(Config_Entries, malformed)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto missing_colon = parse_config_entries(u8"title My Doc", &memory);
    ASSERT_FALSE(missing_colon);
    EXPECT_EQ(missing_colon.error(), u8"Expected 'key: value', but found: title My Doc");

    EXPECT_FALSE(parse_config_entries(u8": value", &memory));
}

TEST_F(Markup_Parsing, paragraphs)
{
    const Document document = parse(u8"first line\nsecond line\n\n\nnext paragraph\n");
    EXPECT_EQ(document.path, u8"test.lamp");
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"first line\\nsecond line\")]\n"
        u8"Paragraph[Text(\"next paragraph\")]\n"
    );
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Markup_Parsing, empty_document)
{
    const Document document = parse(u8"  \n\n");
    EXPECT_TRUE(document.content.empty());
}

TEST_F(Markup_Parsing, escapes_and_references)
{
    const Document document = parse(u8"a \\@ b \\{{x}} {{ config.title }}");
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"a @ b {{x}} \"), Reference(config.title)]\n"
    );
}

TEST_F(Markup_Parsing, span_directive)
{
    const Document document = parse(u8"some @:style strong: {bold {{name}}} text");
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"some \"), Styled(strong)[Text(\"bold \"), Reference(name)], "
        u8"Text(\" text\")]\n"
    );
}

TEST_F(Markup_Parsing, unknown_span_directive)
{
    const Document document = parse(u8"x @:nope. y");
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"x \"), Invalid_Span(\"One or more errors processing directive "
        u8"'nope': No span directive registered with name: nope\", \"@:nope.\"), "
        u8"Text(\" y\")]\n"
    );
    EXPECT_TRUE(logger.was_logged(diagnostic::directive_lookup));
}

TEST_F(Markup_Parsing, malformed_span_directive_is_text)
{
    const Document document = parse(u8"mail me @ home");
    EXPECT_EQ(dump(document.content), u8"Paragraph[Text(\"mail me @ home\")]\n");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Markup_Parsing, block_directive)
{
    const Document document = parse(u8"intro\n\n@:box note: inside\n  the box\n\noutro");
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"intro\")]\n"
        u8"Block_Sequence(note)[Paragraph[Text(\"inside\\nthe box\")]]\n"
        u8"Paragraph[Text(\"outro\")]\n"
    );
}

TEST_F(Markup_Parsing, nested_block_directives)
{
    const Document document = parse(u8"@:box:\n  @:literal: raw {{text}}\n\n  paragraph");
    EXPECT_EQ(
        dump(document.content),
        u8"Block_Sequence(box)[Literal_Block(\"raw {{text}}\"), Paragraph[Text(\"paragraph\")]]\n"
    );
}

TEST_F(Markup_Parsing, block_directive_with_trailing_text_is_paragraph)
{
    const Document document = parse(u8"@:toc. and more");
    ASSERT_EQ(document.content.size(), 1);
    EXPECT_TRUE(document.content[0].try_as_paragraph());
}

TEST_F(Markup_Parsing, block_directive_with_empty_body_is_paragraph)
{
    const Document document = parse(u8"@:literal:\n\nnext");
    ASSERT_EQ(document.content.size(), 2);
    EXPECT_TRUE(document.content[0].try_as_paragraph());
}

TEST_F(Markup_Parsing, config_header)
{
    const Document document = parse(u8"{%\ntitle: Hello\n%}\n\ntext");
    ASSERT_EQ(document.config.size(), 1);
    EXPECT_EQ(document.config.find(u8"title")->second, u8"Hello");
    EXPECT_EQ(dump(document.content), u8"Paragraph[Text(\"text\")]\n");
}

TEST_F(Markup_Parsing, malformed_config_header)
{
    const Document document = parse(u8"{% nonsense %}\ntext");
    EXPECT_TRUE(document.config.empty());
    EXPECT_EQ(
        dump(document.content),
        u8"Invalid_Block(\"Error parsing config header: Expected 'key: value', but found: "
        u8"nonsense\", \"{% nonsense %}\")\n"
        u8"Paragraph[Text(\"text\")]\n"
    );
    EXPECT_TRUE(logger.was_logged(diagnostic::config_header));
}

TEST_F(Markup_Parsing, unterminated_config_header_is_text)
{
    const Document document = parse(u8"{% title: x");
    EXPECT_TRUE(document.config.empty());
    EXPECT_EQ(dump(document.content), u8"Paragraph[Text(\"{% title: x\")]\n");
}

TEST_F(Markup_Parsing, nesting_depth_limit)
{
    const Document document = parse(u8"@:box:\n  @:box:\n    @:box:\n      text", 1);
    EXPECT_EQ(
        dump(document.content),
        u8"Block_Sequence(box)[Block_Sequence(box)[Literal_Block(\"@:box:\\n  text\")]]\n"
    );
    EXPECT_TRUE(logger.was_logged(diagnostic::nesting_depth));
}

TEST_F(Markup_Parsing, diagnostics_in_bodies_are_located_at_the_directive)
{
    const Document document = parse(u8"intro\n\n@:box:\n  see @:nope.");
    ASSERT_EQ(logger.count(diagnostic::directive_lookup), 1);
    for (const Collected_Diagnostic& d : logger.diagnostics) {
        EXPECT_EQ(d.location.line, 2);
        EXPECT_EQ(d.location.column, 0);
        EXPECT_EQ(d.location.begin, 7);
    }
}

TEST_F(Markup_Parsing, placeholders_in_bodies_are_located_at_the_directive)
{
    const Document document = parse(u8"x\n@:style em: {@:config who.}");
    ASSERT_EQ(document.content.size(), 1);
    const auto& paragraph = std::get<ast::Paragraph>(document.content[0]);
    ASSERT_EQ(paragraph.content.size(), 2);
    const auto& styled = std::get<ast::Styled>(paragraph.content[1]);
    ASSERT_EQ(styled.content.size(), 1);
    const ast::Span_Placeholder* const placeholder = styled.content[0].try_as_placeholder();
    ASSERT_TRUE(placeholder);
    EXPECT_EQ(placeholder->location.line, 1);
    EXPECT_EQ(placeholder->location.column, 1);
    EXPECT_EQ(placeholder->location.begin, 3);
}

} // namespace
} // namespace lamp
