#ifndef LAMP_BUILTIN_DIRECTIVE_SET_HPP
#define LAMP_BUILTIN_DIRECTIVE_SET_HPP

#include <memory_resource>
#include <optional>
#include <string_view>

#include "lamp/ast.hpp"
#include "lamp/directive.hpp"
#include "lamp/fwd.hpp"

namespace lamp {

inline constexpr std::u8string_view default_box_style = u8"box";
inline constexpr std::u8string_view toc_style = u8"toc";

/// @brief Returns the part with the given `kind` and `name`,
/// or appends `"required <part> is missing"` to `errors` if there is no such part.
[[nodiscard]]
std::optional<std::u8string_view> require_part(
    const Directive_Context_Base& context,
    Part_Kind kind,
    std::u8string_view name,
    Messages& errors
);

/// @brief Behavior for `@:style name { content }`.
/// Applies the style given by the default attribute to the spans in the default body.
struct Style_Behavior final : Span_Directive {
    [[nodiscard]]
    constexpr explicit Style_Behavior()
        = default;

    [[nodiscard]]
    Directive_Result<ast::Span> operator()(const Span_Directive_Context& context) const final;
};

/// @brief Behavior for `@:config key.`,
/// which is replaced with the configuration value for `key`
/// once the document tree is complete.
struct Config_Behavior final : Span_Directive {
    [[nodiscard]]
    constexpr explicit Config_Behavior()
        : Span_Directive { Context_Requirement::cursor }
    {
    }

    [[nodiscard]]
    Directive_Result<ast::Span> operator()(const Span_Directive_Context& context) const final;
};

/// @brief Behavior for block directives such as `@:box note: content`,
/// which parse their default body as blocks and wrap them in a `Block_Sequence`.
/// The style is given by the optional default attribute.
struct Box_Behavior final : Block_Directive {
    [[nodiscard]]
    constexpr explicit Box_Behavior()
        = default;

    [[nodiscard]]
    Directive_Result<ast::Block> operator()(const Block_Directive_Context& context) const final;
};

/// @brief Behavior for `@:toc.`, which lists the paths of all documents in the tree.
struct Toc_Behavior final : Block_Directive {
    [[nodiscard]]
    constexpr explicit Toc_Behavior()
        : Block_Directive { Context_Requirement::cursor }
    {
    }

    [[nodiscard]]
    Directive_Result<ast::Block> operator()(const Block_Directive_Context& context) const final;
};

/// @brief Behavior for `@:literal: text`, which keeps its default body verbatim.
struct Literal_Behavior final : Block_Directive {
    [[nodiscard]]
    constexpr explicit Literal_Behavior()
        = default;

    [[nodiscard]]
    Directive_Result<ast::Block> operator()(const Block_Directive_Context& context) const final;
};

/// @brief Owns the builtin directive behaviors and the registries which refer to them.
struct Builtin_Directive_Set {
private:
    Style_Behavior m_style;
    Config_Behavior m_config;
    Box_Behavior m_box;
    Toc_Behavior m_toc;
    Literal_Behavior m_literal;

    Span_Directive_Registry m_span_directives;
    Block_Directive_Registry m_block_directives;
    Span_Directive_Registry m_template_directives;

public:
    [[nodiscard]]
    explicit Builtin_Directive_Set(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    );

    Builtin_Directive_Set(const Builtin_Directive_Set&) = delete;
    Builtin_Directive_Set& operator=(const Builtin_Directive_Set&) = delete;

    /// @brief Returns the directives which can be used within paragraphs:
    /// `style` and `config`.
    [[nodiscard]]
    const Span_Directive_Registry& span_directives() const
    {
        return m_span_directives;
    }

    /// @brief Returns the directives which can be used at the start of a line:
    /// `box`, `toc`, and `literal`.
    [[nodiscard]]
    const Block_Directive_Registry& block_directives() const
    {
        return m_block_directives;
    }

    /// @brief Returns the directives which can be used within templates:
    /// `style` and `config`.
    [[nodiscard]]
    const Span_Directive_Registry& template_directives() const
    {
        return m_template_directives;
    }
};

} // namespace lamp

#endif
