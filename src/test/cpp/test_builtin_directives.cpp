#include <cstddef>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "lamp/builtin_directive_set.hpp"
#include "lamp/collecting_logger.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/markup_directives.hpp"
#include "lamp/markup_parser.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/rewrite.hpp"
#include "test_support.hpp"

namespace lamp {
namespace {

struct Builtin_Directives : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Builtin_Directive_Set directives { &memory };
    // Placeholders refer to the parser that produced them,
    // so every parser is kept until the tree has been resolved.
    std::vector<std::unique_ptr<Markup_Parser>> parsers;
    Document_Tree tree;

    void add_document(std::u8string_view path, std::u8string_view source)
    {
        const Parse_Options options {
            .file_name = path,
            .logger = logger,
            .memory = &memory,
        };
        auto& parser = parsers.emplace_back(std::make_unique<Markup_Parser>(
            directives.span_directives(), directives.block_directives(), options
        ));
        tree.documents.push_back(parser->parse_document(source));
    }

    [[nodiscard]]
    std::pmr::u8string dump_content(std::size_t index) const
    {
        return dump(tree.documents[index].content);
    }
};

TEST_F(Builtin_Directives, style)
{
    add_document(u8"a.lamp", u8"a @:style em: {b @:style strong: {c}} d");
    EXPECT_EQ(
        dump_content(0),
        u8"Paragraph[Text(\"a \"), Styled(em)[Text(\"b \"), Styled(strong)[Text(\"c\")]], "
        u8"Text(\" d\")]\n"
    );
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Builtin_Directives, style_with_non_ascii_name)
{
    add_document(u8"a.lamp", u8"@:style größe: {x}");
    EXPECT_EQ(dump_content(0), u8"Paragraph[Styled(größe)[Text(\"x\")]]\n");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Builtin_Directives, style_missing_parts)
{
    add_document(u8"a.lamp", u8"@:style: {x}");
    EXPECT_EQ(
        dump_content(0),
        u8"Paragraph[Invalid_Span(\"One or more errors processing directive 'style': "
        u8"required default attribute is missing\", \"@:style: {x}\")]\n"
    );
    EXPECT_TRUE(logger.was_logged(diagnostic::directive_execution));
}

TEST_F(Builtin_Directives, box_and_literal)
{
    add_document(u8"a.lamp", u8"@:box warning: Careful!\n\n@:literal: {{kept}} @:as-is.\n");
    EXPECT_EQ(
        dump_content(0),
        u8"Block_Sequence(warning)[Paragraph[Text(\"Careful!\")]]\n"
        u8"Literal_Block(\"{{kept}} @:as-is.\")\n"
    );
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Builtin_Directives, box_default_style)
{
    add_document(u8"a.lamp", u8"@:box: text");
    EXPECT_EQ(dump_content(0), u8"Block_Sequence(box)[Paragraph[Text(\"text\")]]\n");
}

TEST_F(Builtin_Directives, box_missing_body)
{
    add_document(u8"a.lamp", u8"@:box.");
    EXPECT_EQ(
        dump_content(0),
        u8"Invalid_Block(\"One or more errors processing directive 'box': "
        u8"required default body is missing\", \"@:box.\")\n"
    );
    EXPECT_EQ(logger.count(diagnostic::directive_execution), 1);
}

TEST_F(Builtin_Directives, config_and_toc_are_deferred)
{
    add_document(u8"a.lamp", u8"{%\ntitle: Alpha\n%}\nTitle: @:config title.\n\n@:toc.\n");
    add_document(u8"b.lamp", u8"By @:config author.");
    tree.config.emplace(u8"author", u8"Jane");

    EXPECT_EQ(
        dump_content(0), u8"Paragraph[Text(\"Title: \"), Span_Placeholder]\nBlock_Placeholder\n"
    );

    resolve_placeholders(tree, logger);

    EXPECT_EQ(
        dump_content(0),
        u8"Paragraph[Text(\"Title: \"), Text(\"Alpha\")]\n"
        u8"Block_Sequence(toc)[Paragraph[Text(\"a.lamp\")], Paragraph[Text(\"b.lamp\")]]\n"
    );
    EXPECT_EQ(dump_content(1), u8"Paragraph[Text(\"By \"), Text(\"Jane\")]\n");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Builtin_Directives, config_missing_value)
{
    add_document(u8"a.lamp", u8"@:config nope.");
    resolve_placeholders(tree, logger);

    EXPECT_EQ(
        dump_content(0),
        u8"Paragraph[Invalid_Span(\"One or more errors processing directive 'config': "
        u8"No configuration value for key: nope\", \"@:config nope.\")]\n"
    );
    EXPECT_TRUE(logger.was_logged(diagnostic::placeholder_invalid));
}

TEST_F(Builtin_Directives, config_in_style_body)
{
    add_document(u8"a.lamp", u8"@:style em: {@:config who.}");
    tree.config.emplace(u8"who", u8"me");
    resolve_placeholders(tree, logger);

    EXPECT_EQ(dump_content(0), u8"Paragraph[Styled(em)[Text(\"me\")]]\n");
}

TEST_F(Builtin_Directives, template_directives)
{
    const Parse_Options options {
        .file_name = u8"template",
        .logger = logger,
        .memory = &memory,
    };
    Template_Parser parser { directives.template_directives(), options };

    const std::pmr::vector<ast::Span> spans
        = parser.parse_template(u8"Hello @:style em: {{{name}}}!");
    EXPECT_EQ(dump(spans), u8"Text(\"Hello \"), Styled(em)[Reference(name)], Text(\"!\")");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Builtin_Directives, template_nesting_depth_limit)
{
    const Parse_Options options {
        .file_name = u8"template",
        .logger = logger,
        .max_nesting_depth = 1,
        .memory = &memory,
    };
    Template_Parser parser { directives.template_directives(), options };

    const std::pmr::vector<ast::Span> spans
        = parser.parse_template(u8"@:style em: {@:style b: {x}}");
    EXPECT_EQ(dump(spans), u8"Styled(em)[Styled(b)[Text(\"x\")]]");
    ASSERT_EQ(logger.count(diagnostic::nesting_depth), 1);
    EXPECT_EQ(logger.diagnostics[0].location.begin, 1);
}

TEST(Builtin_Registries, names_and_requirements)
{
    const Builtin_Directive_Set directives;
    EXPECT_NE(directives.span_directives().find(u8"style"), nullptr);
    EXPECT_NE(directives.span_directives().find(u8"config"), nullptr);
    EXPECT_EQ(directives.span_directives().find(u8"box"), nullptr);
    EXPECT_EQ(directives.block_directives().size(), 3);
    EXPECT_NE(directives.block_directives().find(u8"toc"), nullptr);
    EXPECT_NE(directives.template_directives().find(u8"config"), nullptr);

    EXPECT_FALSE(directives.span_directives().find(u8"style")->requires_context());
    EXPECT_TRUE(directives.span_directives().find(u8"config")->requires_context());
    EXPECT_TRUE(directives.block_directives().find(u8"toc")->requires_context());
}

} // namespace
} // namespace lamp
