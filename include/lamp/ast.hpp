#ifndef LAMP_AST_HPP
#define LAMP_AST_HPP

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "lamp/util/source_position.hpp"

#include "lamp/fwd.hpp"

namespace lamp::ast {

/// @brief Computes the replacement for a placeholder once the document tree is complete.
template <typename T>
struct Resolver {
    virtual ~Resolver() = default;

    /// @brief Returns the element which replaces the placeholder.
    /// This is called at most once for any resolver.
    [[nodiscard]]
    virtual T resolve(const Document_Cursor& cursor) const
        = 0;
};

// SPANS ===========================================================================================

/// @brief Plain text.
struct Text {
    std::pmr::u8string text;

    [[nodiscard]]
    friend bool operator==(const Text&, const Text&)
        = default;
};

/// @brief A reference such as `{{config.title}}` to a value which is only known once the
/// document tree is complete.
struct Reference {
    std::pmr::u8string name;

    [[nodiscard]]
    friend bool operator==(const Reference&, const Reference&)
        = default;
};

/// @brief A sequence of spans with a named style applied to them.
struct Styled {
    std::pmr::u8string style;
    std::pmr::vector<Span> content;
};

/// @brief Stands in for a span which could not be produced.
struct Invalid_Span {
    /// @brief The error message.
    std::pmr::u8string message;
    /// @brief The literal text which is displayed instead of the span.
    std::pmr::u8string fallback;

    [[nodiscard]]
    friend bool operator==(const Invalid_Span&, const Invalid_Span&)
        = default;
};

/// @brief A span which is computed only once the document tree is complete.
struct Span_Placeholder {
    std::unique_ptr<Resolver<Span>> resolver;
    Source_Span location;
};

/// @brief An instruction for `Span_Builder` to take back the last `drop_length` code units of
/// literal text which were appended to it.
/// This lets a parser triggered by some character claim text which precedes that character.
/// A `Retraction` never appears in the result of a `Span_Builder`.
struct Retraction {
    /// @brief The number of code points to take back from the end of the pending text.
    std::size_t drop_length;
    /// @brief Appended if enough literal text could be taken back.
    std::pmr::vector<Span> replacement;
    /// @brief Appended otherwise.
    std::pmr::vector<Span> fallback;
};

using Span_Variant
    = std::variant<Text, Reference, Styled, Invalid_Span, Span_Placeholder, Retraction>;

struct Span : Span_Variant {
    using Span_Variant::variant;

    [[nodiscard]]
    Text* try_as_text()
    {
        return std::get_if<Text>(this);
    }
    [[nodiscard]]
    const Text* try_as_text() const
    {
        return std::get_if<Text>(this);
    }

    [[nodiscard]]
    const Reference* try_as_reference() const
    {
        return std::get_if<Reference>(this);
    }

    [[nodiscard]]
    const Styled* try_as_styled() const
    {
        return std::get_if<Styled>(this);
    }

    [[nodiscard]]
    const Invalid_Span* try_as_invalid() const
    {
        return std::get_if<Invalid_Span>(this);
    }

    [[nodiscard]]
    const Span_Placeholder* try_as_placeholder() const
    {
        return std::get_if<Span_Placeholder>(this);
    }

    [[nodiscard]]
    Retraction* try_as_retraction()
    {
        return std::get_if<Retraction>(this);
    }
};

static_assert(std::is_nothrow_move_constructible_v<Span>);
static_assert(!std::is_copy_constructible_v<Span>);

// BLOCKS ==========================================================================================

struct Paragraph {
    std::pmr::vector<Span> content;
};

/// @brief Text which is displayed verbatim.
struct Literal_Block {
    std::pmr::u8string text;

    [[nodiscard]]
    friend bool operator==(const Literal_Block&, const Literal_Block&)
        = default;
};

/// @brief A sequence of blocks with a named style applied to them.
struct Block_Sequence {
    std::pmr::u8string style;
    std::pmr::vector<Block> content;
};

/// @brief Stands in for a block which could not be produced.
struct Invalid_Block {
    /// @brief The error message.
    std::pmr::u8string message;
    /// @brief The literal text which is displayed instead of the block.
    std::pmr::u8string fallback;

    [[nodiscard]]
    friend bool operator==(const Invalid_Block&, const Invalid_Block&)
        = default;
};

/// @brief A block which is computed only once the document tree is complete.
struct Block_Placeholder {
    std::unique_ptr<Resolver<Block>> resolver;
    Source_Span location;
};

using Block_Variant
    = std::variant<Paragraph, Literal_Block, Block_Sequence, Invalid_Block, Block_Placeholder>;

struct Block : Block_Variant {
    using Block_Variant::variant;

    [[nodiscard]]
    const Paragraph* try_as_paragraph() const
    {
        return std::get_if<Paragraph>(this);
    }

    [[nodiscard]]
    const Literal_Block* try_as_literal() const
    {
        return std::get_if<Literal_Block>(this);
    }

    [[nodiscard]]
    const Block_Sequence* try_as_sequence() const
    {
        return std::get_if<Block_Sequence>(this);
    }

    [[nodiscard]]
    const Invalid_Block* try_as_invalid() const
    {
        return std::get_if<Invalid_Block>(this);
    }

    [[nodiscard]]
    const Block_Placeholder* try_as_placeholder() const
    {
        return std::get_if<Block_Placeholder>(this);
    }
};

static_assert(std::is_nothrow_move_constructible_v<Block>);

// FACTORIES =======================================================================================

[[nodiscard]]
Span make_text(std::u8string_view text, std::pmr::memory_resource* memory);

[[nodiscard]]
Span make_reference(std::u8string_view name, std::pmr::memory_resource* memory);

[[nodiscard]]
Span make_invalid_span(
    std::u8string_view message,
    std::u8string_view fallback,
    std::pmr::memory_resource* memory
);

[[nodiscard]]
Span make_span_placeholder(std::unique_ptr<Resolver<Span>>&& resolver, const Source_Span& location);

[[nodiscard]]
Block make_literal_block(std::u8string_view text, std::pmr::memory_resource* memory);

[[nodiscard]]
Block make_invalid_block(
    std::u8string_view message,
    std::u8string_view fallback,
    std::pmr::memory_resource* memory
);

[[nodiscard]]
Block
make_block_placeholder(std::unique_ptr<Resolver<Block>>&& resolver, const Source_Span& location);

/// @brief Returns `true` if `span` is or contains a `Span_Placeholder`.
[[nodiscard]]
bool contains_placeholder(const Span& span);

/// @brief Returns `true` if `block` is or contains a `Span_Placeholder` or `Block_Placeholder`.
[[nodiscard]]
bool contains_placeholder(const Block& block);

} // namespace lamp::ast

#endif
