#include <memory>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <variant>

#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"

namespace lamp::ast {

Span make_text(std::u8string_view text, std::pmr::memory_resource* memory)
{
    return Text { .text = std::pmr::u8string { text, memory } };
}

Span make_reference(std::u8string_view name, std::pmr::memory_resource* memory)
{
    return Reference { .name = std::pmr::u8string { name, memory } };
}

Span make_invalid_span(
    std::u8string_view message,
    std::u8string_view fallback,
    std::pmr::memory_resource* memory
)
{
    return Invalid_Span {
        .message = std::pmr::u8string { message, memory },
        .fallback = std::pmr::u8string { fallback, memory },
    };
}

Span make_span_placeholder(std::unique_ptr<Resolver<Span>>&& resolver, const Source_Span& location)
{
    return Span_Placeholder { .resolver = std::move(resolver), .location = location };
}

Block make_literal_block(std::u8string_view text, std::pmr::memory_resource* memory)
{
    return Literal_Block { .text = std::pmr::u8string { text, memory } };
}

Block make_invalid_block(
    std::u8string_view message,
    std::u8string_view fallback,
    std::pmr::memory_resource* memory
)
{
    return Invalid_Block {
        .message = std::pmr::u8string { message, memory },
        .fallback = std::pmr::u8string { fallback, memory },
    };
}

Block make_block_placeholder(std::unique_ptr<Resolver<Block>>&& resolver, const Source_Span& location)
{
    return Block_Placeholder { .resolver = std::move(resolver), .location = location };
}

bool contains_placeholder(const Span& span)
{
    if (span.try_as_placeholder()) {
        return true;
    }
    if (const Styled* const styled = span.try_as_styled()) {
        for (const Span& child : styled->content) {
            if (contains_placeholder(child)) {
                return true;
            }
        }
    }
    return false;
}

bool contains_placeholder(const Block& block)
{
    return std::visit(
        []<typename T>(const T& b) -> bool {
            if constexpr (std::is_same_v<T, Block_Placeholder>) {
                return true;
            }
            else if constexpr (std::is_same_v<T, Paragraph>) {
                for (const Span& child : b.content) {
                    if (contains_placeholder(child)) {
                        return true;
                    }
                }
                return false;
            }
            else if constexpr (std::is_same_v<T, Block_Sequence>) {
                for (const Block& child : b.content) {
                    if (contains_placeholder(child)) {
                        return true;
                    }
                }
                return false;
            }
            else {
                return false;
            }
        },
        block
    );
}

} // namespace lamp::ast
