#ifndef LAMP_DIRECTIVE_HPP
#define LAMP_DIRECTIVE_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/assert.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/fwd.hpp"

namespace lamp {

enum struct Part_Kind : bool {
    attribute,
    body,
};

/// @brief Identifies an attribute or body of a directive.
/// The default (unnamed) attribute or body has an empty `name`.
/// Since names always begin with a letter, this cannot be confused with a named part.
struct Part_Key {
    Part_Kind kind;
    std::pmr::u8string name;

    [[nodiscard]]
    bool is_default() const
    {
        return name.empty();
    }

    [[nodiscard]]
    friend bool operator==(const Part_Key&, const Part_Key&)
        = default;
    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Part_Key&, const Part_Key&)
        = default;
};

/// @brief Returns a description of `key` for use in error messages,
/// such as `"default attribute"` or `"body: footer"`.
[[nodiscard]]
std::pmr::u8string describe(const Part_Key& key, std::pmr::memory_resource* memory);

/// @brief An attribute or body of a directive, with its raw content.
struct Part {
    Part_Key key;
    std::pmr::u8string content;
};

/// @brief The result of parsing a directive, before it is looked up or validated.
/// The same key may occur multiple times in `parts`.
struct Parsed_Directive {
    std::pmr::u8string name;
    std::pmr::vector<Part> parts;
};

using Part_Map = std::pmr::map<Part_Key, std::pmr::u8string>;

/// @brief The error messages of a failed directive application.
using Messages = std::pmr::vector<std::pmr::u8string>;

template <typename T>
using Directive_Result = Result<T, Messages>;

/// @brief Parses nested markup on behalf of a directive.
/// This is implemented by the host grammar,
/// so that directive bodies can be parsed with the same rules as the surrounding text.
/// `origin` is the location of the directive whose body `source` is.
struct Recursive_Span_Parser {
    [[nodiscard]]
    virtual std::pmr::vector<ast::Span>
    parse_spans(std::u8string_view source, const Source_Span& origin)
        = 0;

protected:
    ~Recursive_Span_Parser() = default;
};

struct Recursive_Parsers : Recursive_Span_Parser {
    [[nodiscard]]
    virtual std::pmr::vector<ast::Block>
    parse_blocks(std::u8string_view source, const Source_Span& origin)
        = 0;

protected:
    ~Recursive_Parsers() = default;
};

/// @brief The information available to a directive when it is executed.
struct Directive_Context_Base {
    /// @brief The attributes and bodies of the directive, with unique keys.
    const Part_Map& parts;
    /// @brief The cursor into the complete document tree,
    /// or null if the directive is executed during parsing.
    const Document_Cursor* cursor;
    /// @brief The location of the directive.
    Source_Span location;
    std::pmr::memory_resource* memory;

    [[nodiscard]]
    std::optional<std::u8string_view> part(Part_Kind kind, std::u8string_view name = {}) const;

    [[nodiscard]]
    std::optional<std::u8string_view> default_attribute() const
    {
        return part(Part_Kind::attribute);
    }

    [[nodiscard]]
    std::optional<std::u8string_view> attribute(std::u8string_view name) const
    {
        return part(Part_Kind::attribute, name);
    }

    [[nodiscard]]
    std::optional<std::u8string_view> default_body() const
    {
        return part(Part_Kind::body);
    }

    [[nodiscard]]
    std::optional<std::u8string_view> body(std::u8string_view name) const
    {
        return part(Part_Kind::body, name);
    }
};

/// @brief The context of span and template directives,
/// which can parse their bodies into spans.
struct Span_Directive_Context : Directive_Context_Base {
    using parser_type = Recursive_Span_Parser;

    parser_type& parser;

    [[nodiscard]]
    Span_Directive_Context(
        const Part_Map& parts,
        const Document_Cursor* cursor,
        parser_type& parser,
        const Source_Span& location,
        std::pmr::memory_resource* memory
    )
        : Directive_Context_Base { parts, cursor, location, memory }
        , parser { parser }
    {
    }

    [[nodiscard]]
    std::pmr::vector<ast::Span> parse_spans(std::u8string_view source) const
    {
        return parser.parse_spans(source, location);
    }
};

/// @brief The context of block directives,
/// which can parse their bodies into spans or blocks.
struct Block_Directive_Context : Directive_Context_Base {
    using parser_type = Recursive_Parsers;

    parser_type& parser;

    [[nodiscard]]
    Block_Directive_Context(
        const Part_Map& parts,
        const Document_Cursor* cursor,
        parser_type& parser,
        const Source_Span& location,
        std::pmr::memory_resource* memory
    )
        : Directive_Context_Base { parts, cursor, location, memory }
        , parser { parser }
    {
    }

    [[nodiscard]]
    std::pmr::vector<ast::Span> parse_spans(std::u8string_view source) const
    {
        return parser.parse_spans(source, location);
    }

    [[nodiscard]]
    std::pmr::vector<ast::Block> parse_blocks(std::u8string_view source) const
    {
        return parser.parse_blocks(source, location);
    }
};

enum struct Context_Requirement : bool {
    /// @brief The directive is executed as soon as it is parsed.
    none,
    /// @brief The directive needs a `Document_Cursor`,
    /// so it is replaced with a placeholder and executed once the document tree is complete.
    cursor,
};

/// @brief The behavior of a user-registrable directive.
template <typename Context, typename Element>
struct Directive_Behavior {
    using context_type = Context;
    using element_type = Element;

private:
    Context_Requirement m_requirement;

public:
    [[nodiscard]]
    constexpr explicit Directive_Behavior(Context_Requirement requirement = Context_Requirement::none)
        : m_requirement { requirement }
    {
    }

    [[nodiscard]]
    constexpr bool requires_context() const
    {
        return m_requirement == Context_Requirement::cursor;
    }

    [[nodiscard]]
    virtual Directive_Result<Element> operator()(const Context& context) const
        = 0;

protected:
    ~Directive_Behavior() = default;
};

using Span_Directive = Directive_Behavior<Span_Directive_Context, ast::Span>;
using Block_Directive = Directive_Behavior<Block_Directive_Context, ast::Block>;

/// @brief An immutable mapping of names to directive behaviors.
/// The behaviors are not owned by the registry.
template <typename Directive>
struct Directive_Registry {
    struct Entry {
        std::pmr::u8string name;
        const Directive* directive;
    };

private:
    std::pmr::vector<Entry> m_entries;

public:
    /// @brief Creates a registry from pairs of names and behaviors.
    /// If the same name occurs multiple times, the last behavior is used.
    [[nodiscard]]
    explicit Directive_Registry(
        std::span<const std::pair<std::u8string_view, const Directive*>> entries,
        std::pmr::memory_resource* memory
    )
        : m_entries { memory }
    {
        m_entries.reserve(entries.size());
        for (const auto& [name, directive] : entries) {
            LAMP_ASSERT(directive);
            const auto it = std::ranges::lower_bound(m_entries, name, {}, &Entry::name);
            if (it != m_entries.end() && it->name == name) {
                it->directive = directive;
            }
            else {
                m_entries.insert(it, Entry { std::pmr::u8string { name, memory }, directive });
            }
        }
    }

    [[nodiscard]]
    const Directive* find(std::u8string_view name) const
    {
        const auto it = std::ranges::lower_bound(m_entries, name, {}, &Entry::name);
        return it != m_entries.end() && it->name == name ? it->directive : nullptr;
    }

    /// @brief Returns the registered names, in ascending order.
    [[nodiscard]]
    std::pmr::vector<std::u8string_view> names(std::pmr::memory_resource* memory) const
    {
        std::pmr::vector<std::u8string_view> result { memory };
        result.reserve(m_entries.size());
        for (const Entry& entry : m_entries) {
            result.push_back(entry.name);
        }
        return result;
    }

    [[nodiscard]]
    std::size_t size() const
    {
        return m_entries.size();
    }
};

using Span_Directive_Registry = Directive_Registry<Span_Directive>;
using Block_Directive_Registry = Directive_Registry<Block_Directive>;

/// @brief Describes how directives of one kind are turned into tree elements.
template <typename Context, typename Element>
struct Directive_Kind {
    /// @brief The name of the kind in error messages, such as `"span"`.
    std::u8string_view label;
    Element (*make_invalid)(
        std::u8string_view message,
        std::u8string_view fallback,
        std::pmr::memory_resource* memory
    );
    Element (*make_placeholder)(
        std::unique_ptr<ast::Resolver<Element>>&& resolver,
        const Source_Span& location
    );
};

inline constexpr Directive_Kind<Span_Directive_Context, ast::Span> span_directive_kind {
    .label = u8"span",
    .make_invalid = &ast::make_invalid_span,
    .make_placeholder = &ast::make_span_placeholder,
};

inline constexpr Directive_Kind<Span_Directive_Context, ast::Span> template_directive_kind {
    .label = u8"template",
    .make_invalid = &ast::make_invalid_span,
    .make_placeholder = &ast::make_span_placeholder,
};

inline constexpr Directive_Kind<Block_Directive_Context, ast::Block> block_directive_kind {
    .label = u8"block",
    .make_invalid = &ast::make_invalid_block,
    .make_placeholder = &ast::make_block_placeholder,
};

} // namespace lamp

#endif
