#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lamp/util/assert.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/rewrite.hpp"
#include "lamp/services.hpp"

namespace lamp {

namespace {

constexpr std::u8string_view nested_placeholder_message
    = u8"Placeholder resolution produced another placeholder.";

/// @brief The nodes of a document which still need to be resolved,
/// in document order.
struct Pending_Nodes {
    std::pmr::vector<ast::Span*> spans;
    std::pmr::vector<ast::Block*> blocks;

    [[nodiscard]]
    bool empty() const
    {
        return spans.empty() && blocks.empty();
    }
};

void collect(ast::Span& span, Pending_Nodes& out)
{
    if (span.try_as_placeholder() || span.try_as_reference()) {
        out.spans.push_back(&span);
    }
    else if (auto* const styled = std::get_if<ast::Styled>(&span)) {
        for (ast::Span& child : styled->content) {
            collect(child, out);
        }
    }
}

void collect(ast::Block& block, Pending_Nodes& out)
{
    if (block.try_as_placeholder()) {
        out.blocks.push_back(&block);
    }
    else if (auto* const paragraph = std::get_if<ast::Paragraph>(&block)) {
        for (ast::Span& span : paragraph->content) {
            collect(span, out);
        }
    }
    else if (auto* const sequence = std::get_if<ast::Block_Sequence>(&block)) {
        for (ast::Block& child : sequence->content) {
            collect(child, out);
        }
    }
}

struct Document_Resolver {
    const Document_Cursor cursor;
    Logger& logger;
    std::pmr::memory_resource* memory;

    void log(
        Severity severity,
        std::u8string_view id,
        const Source_Span& location,
        std::u8string_view message
    ) const
    {
        logger.log(
            Diagnostic {
                .severity = severity,
                .id = id,
                .file = cursor.document.path,
                .location = location,
                .message = message,
            }
        );
    }

    [[nodiscard]]
    ast::Span resolve(const ast::Span& span) const
    {
        if (const ast::Reference* const reference = span.try_as_reference()) {
            const std::optional<std::u8string_view> value
                = cursor.resolve_reference(reference->name);
            if (value) {
                return ast::make_text(*value, memory);
            }
            std::pmr::u8string message { u8"Unresolved reference: ", memory };
            message += reference->name;
            log(Severity::warning, diagnostic::reference_unresolved, {}, message);
            return ast::make_text({}, memory);
        }

        const ast::Span_Placeholder* const placeholder = span.try_as_placeholder();
        LAMP_ASSERT(placeholder);
        ast::Span result = placeholder->resolver->resolve(cursor);
        if (ast::contains_placeholder(result)) {
            log(Severity::error, diagnostic::placeholder_nested, placeholder->location,
                nested_placeholder_message);
            return ast::make_invalid_span(nested_placeholder_message, {}, memory);
        }
        if (const ast::Invalid_Span* const invalid = result.try_as_invalid()) {
            log(Severity::error, diagnostic::placeholder_invalid, placeholder->location,
                invalid->message);
        }
        return result;
    }

    [[nodiscard]]
    ast::Block resolve(const ast::Block& block) const
    {
        const ast::Block_Placeholder* const placeholder = block.try_as_placeholder();
        LAMP_ASSERT(placeholder);
        ast::Block result = placeholder->resolver->resolve(cursor);
        if (ast::contains_placeholder(result)) {
            log(Severity::error, diagnostic::placeholder_nested, placeholder->location,
                nested_placeholder_message);
            return ast::make_invalid_block(nested_placeholder_message, {}, memory);
        }
        if (const ast::Invalid_Block* const invalid = result.try_as_invalid()) {
            log(Severity::error, diagnostic::placeholder_invalid, placeholder->location,
                invalid->message);
        }
        return result;
    }
};

void resolve_document(const Document_Tree& tree, Document& document, Logger& logger)
{
    std::pmr::memory_resource* const memory = document.content.get_allocator().resource();
    const Document_Resolver resolver { .cursor = { tree, document },
                                       .logger = logger,
                                       .memory = memory };

    // Resolved placeholders never contain further placeholders,
    // but they may contain references, which are handled by the next iteration.
    while (true) {
        Pending_Nodes pending { .spans = std::pmr::vector<ast::Span*> { memory },
                                .blocks = std::pmr::vector<ast::Block*> { memory } };
        for (ast::Block& block : document.content) {
            collect(block, pending);
        }
        if (pending.empty()) {
            return;
        }

        std::pmr::vector<ast::Span> span_results { memory };
        span_results.reserve(pending.spans.size());
        for (const ast::Span* const span : pending.spans) {
            span_results.push_back(resolver.resolve(*span));
        }
        std::pmr::vector<ast::Block> block_results { memory };
        block_results.reserve(pending.blocks.size());
        for (const ast::Block* const block : pending.blocks) {
            block_results.push_back(resolver.resolve(*block));
        }

        // Spans can be nested in blocks, but no pending span is nested in a pending block,
        // so the replacement order does not matter.
        for (std::size_t i = 0; i < pending.spans.size(); ++i) {
            *pending.spans[i] = std::move(span_results[i]);
        }
        for (std::size_t i = 0; i < pending.blocks.size(); ++i) {
            *pending.blocks[i] = std::move(block_results[i]);
        }
    }
}

} // namespace

void resolve_placeholders(Document_Tree& tree, Logger& logger)
{
    for (Document& document : tree.documents) {
        resolve_document(tree, document, logger);
    }
}

} // namespace lamp
