#include <cstddef>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "lamp/ast.hpp"
#include "lamp/collecting_logger.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/rewrite.hpp"
#include "test_support.hpp"

namespace lamp {
namespace {

/// @brief Resolves to a fixed span produced by `make`, counting its invocations.
struct Test_Span_Resolver final : ast::Resolver<ast::Span> {
    ast::Span (*make)(const Document_Cursor&);
    std::size_t& calls;

    [[nodiscard]]
    Test_Span_Resolver(ast::Span (*make)(const Document_Cursor&), std::size_t& calls)
        : make { make }
        , calls { calls }
    {
    }

    [[nodiscard]]
    ast::Span resolve(const Document_Cursor& cursor) const final
    {
        ++calls;
        return make(cursor);
    }
};

struct Test_Block_Resolver final : ast::Resolver<ast::Block> {
    ast::Block (*make)(const Document_Cursor&);
    std::size_t& calls;

    [[nodiscard]]
    Test_Block_Resolver(ast::Block (*make)(const Document_Cursor&), std::size_t& calls)
        : make { make }
        , calls { calls }
    {
    }

    [[nodiscard]]
    ast::Block resolve(const Document_Cursor& cursor) const final
    {
        ++calls;
        return make(cursor);
    }
};

[[nodiscard]]
ast::Span path_text(const Document_Cursor& cursor)
{
    return ast::make_text(cursor.document.path, std::pmr::get_default_resource());
}

[[nodiscard]]
ast::Span title_reference(const Document_Cursor&)
{
    return ast::make_reference(u8"config.title", std::pmr::get_default_resource());
}

[[nodiscard]]
ast::Span another_placeholder(const Document_Cursor&)
{
    static std::size_t ignored_calls = 0;
    return ast::make_span_placeholder(
        std::make_unique<Test_Span_Resolver>(&path_text, ignored_calls), {}
    );
}

[[nodiscard]]
ast::Span broken_span(const Document_Cursor&)
{
    return ast::make_invalid_span(u8"broken", u8"@:broken.", std::pmr::get_default_resource());
}

[[nodiscard]]
ast::Block document_count(const Document_Cursor& cursor)
{
    std::pmr::u8string text;
    text += char8_t(u8'0' + cursor.tree.documents.size());
    return ast::make_literal_block(text, std::pmr::get_default_resource());
}

[[nodiscard]]
ast::Block styled_placeholder_block(const Document_Cursor&)
{
    static std::size_t ignored_calls = 0;
    ast::Paragraph paragraph;
    paragraph.content.push_back(ast::make_span_placeholder(
        std::make_unique<Test_Span_Resolver>(&path_text, ignored_calls), {}
    ));
    return ast::Block { std::move(paragraph) };
}

struct Rewriting : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Document_Tree tree;

    Document& add_document(std::u8string_view path)
    {
        Document& result = tree.documents.emplace_back();
        result.path = path;
        return result;
    }

    [[nodiscard]]
    static ast::Paragraph& add_paragraph(Document& document)
    {
        ast::Block& block = document.content.emplace_back(ast::Paragraph {});
        return std::get<ast::Paragraph>(block);
    }

    [[nodiscard]]
    static ast::Span span_placeholder(ast::Span (*make)(const Document_Cursor&), std::size_t& calls)
    {
        return ast::make_span_placeholder(std::make_unique<Test_Span_Resolver>(make, calls), {});
    }

    [[nodiscard]]
    static ast::Block block_placeholder(
        ast::Block (*make)(const Document_Cursor&),
        std::size_t& calls
    )
    {
        return ast::make_block_placeholder(std::make_unique<Test_Block_Resolver>(make, calls), {});
    }
};

TEST_F(Rewriting, placeholders_resolve_exactly_once)
{
    std::size_t span_calls = 0;
    std::size_t block_calls = 0;

    Document& first = add_document(u8"a.lamp");
    ast::Paragraph& paragraph = add_paragraph(first);
    paragraph.content.push_back(ast::make_text(u8"in ", &memory));
    paragraph.content.push_back(span_placeholder(&path_text, span_calls));
    first.content.push_back(block_placeholder(&document_count, block_calls));
    add_document(u8"b.lamp");

    resolve_placeholders(tree, logger);

    EXPECT_EQ(span_calls, 1);
    EXPECT_EQ(block_calls, 1);
    EXPECT_EQ(
        dump(tree.documents[0].content), u8"Paragraph[Text(\"in \"), Text(\"a.lamp\")]\n"
                                         u8"Literal_Block(\"2\")\n"
    );
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Rewriting, placeholders_in_nested_elements)
{
    std::size_t calls = 0;

    Document& document = add_document(u8"doc.lamp");
    ast::Styled styled { .style = std::pmr::u8string { u8"strong" }, .content = {} };
    styled.content.push_back(span_placeholder(&path_text, calls));
    ast::Paragraph inner;
    inner.content.push_back(ast::Span { std::move(styled) });
    ast::Block_Sequence sequence { .style = std::pmr::u8string { u8"box" }, .content = {} };
    sequence.content.push_back(ast::Block { std::move(inner) });
    document.content.push_back(ast::Block { std::move(sequence) });

    resolve_placeholders(tree, logger);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(
        dump(document.content),
        u8"Block_Sequence(box)[Paragraph[Styled(strong)[Text(\"doc.lamp\")]]]\n"
    );
}

TEST_F(Rewriting, nested_placeholder_is_rejected)
{
    std::size_t span_calls = 0;
    std::size_t block_calls = 0;

    Document& document = add_document(u8"doc.lamp");
    add_paragraph(document).content.push_back(span_placeholder(&another_placeholder, span_calls));
    document.content.push_back(block_placeholder(&styled_placeholder_block, block_calls));

    resolve_placeholders(tree, logger);

    EXPECT_EQ(span_calls, 1);
    EXPECT_EQ(block_calls, 1);
    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Invalid_Span(\"Placeholder resolution produced another placeholder.\", "
        u8"\"\")]\n"
        u8"Invalid_Block(\"Placeholder resolution produced another placeholder.\", \"\")\n"
    );
    EXPECT_EQ(logger.count(diagnostic::placeholder_nested), 2);
}

TEST_F(Rewriting, invalid_resolution_is_logged)
{
    std::size_t calls = 0;

    Document& document = add_document(u8"doc.lamp");
    add_paragraph(document).content.push_back(span_placeholder(&broken_span, calls));

    resolve_placeholders(tree, logger);

    EXPECT_EQ(dump(document.content), u8"Paragraph[Invalid_Span(\"broken\", \"@:broken.\")]\n");
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::placeholder_invalid);
    EXPECT_EQ(logger.diagnostics[0].file, u8"doc.lamp");
    EXPECT_EQ(logger.diagnostics[0].message, u8"broken");
}

TEST_F(Rewriting, references)
{
    tree.config.emplace(u8"title", u8"Tree Title");
    tree.config.emplace(u8"author", u8"Jane");

    Document& document = add_document(u8"doc.lamp");
    document.config.emplace(u8"title", u8"Own Title");
    ast::Paragraph& paragraph = add_paragraph(document);
    paragraph.content.push_back(ast::make_reference(u8"document.path", &memory));
    paragraph.content.push_back(ast::make_reference(u8"config.title", &memory));
    paragraph.content.push_back(ast::make_reference(u8"author", &memory));

    Document& other = add_document(u8"other.lamp");
    add_paragraph(other).content.push_back(ast::make_reference(u8"title", &memory));

    resolve_placeholders(tree, logger);

    EXPECT_EQ(
        dump(document.content),
        u8"Paragraph[Text(\"doc.lamp\"), Text(\"Own Title\"), Text(\"Jane\")]\n"
    );
    EXPECT_EQ(dump(other.content), u8"Paragraph[Text(\"Tree Title\")]\n");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Rewriting, unresolved_reference)
{
    Document& document = add_document(u8"doc.lamp");
    add_paragraph(document).content.push_back(ast::make_reference(u8"config.missing", &memory));

    resolve_placeholders(tree, logger);

    EXPECT_EQ(dump(document.content), u8"Paragraph[Text(\"\")]\n");
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::reference_unresolved);
    EXPECT_EQ(logger.diagnostics[0].message, u8"Unresolved reference: config.missing");
}

TEST_F(Rewriting, references_from_resolvers)
{
    std::size_t calls = 0;
    tree.config.emplace(u8"title", u8"Title");

    Document& document = add_document(u8"doc.lamp");
    add_paragraph(document).content.push_back(span_placeholder(&title_reference, calls));

    resolve_placeholders(tree, logger);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(dump(document.content), u8"Paragraph[Text(\"Title\")]\n");
    EXPECT_TRUE(logger.nothing_logged());
}

} // namespace
} // namespace lamp
