#ifndef LAMP_DIRECTIVE_APPLICATION_HPP
#define LAMP_DIRECTIVE_APPLICATION_HPP

#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/function_ref.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/directive.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief Where a directive is applied,
/// and what the surrounding grammar provides to it.
template <typename Context>
struct Directive_Site {
    /// @brief Parses the bodies of the directive.
    /// This must outlive any placeholder created for the directive.
    typename Context::parser_type& parser;
    /// @brief The literal text which is displayed if the directive cannot be applied.
    std::u8string_view fallback;
    /// @brief The location of the directive in the document.
    /// Within a directive body, this is the location of the outermost enclosing directive.
    Source_Span location;
    const Parse_Options& options;
};

/// @brief Returns `"No " + label + " directive registered with name: " + name`.
[[nodiscard]]
std::pmr::u8string lookup_failure_message(
    std::u8string_view label,
    std::u8string_view name,
    std::pmr::memory_resource* memory
);

/// @brief Returns the message of the invalid element which replaces a directive
/// that failed with `messages`.
[[nodiscard]]
std::pmr::u8string invalid_directive_message(
    std::u8string_view name,
    std::span<const std::pmr::u8string> messages,
    std::pmr::memory_resource* memory
);

/// @brief Converts `parts` into a `Part_Map`,
/// or returns one `"Duplicate ..."` message for every key that occurs more than once,
/// in the order in which these keys first occur.
[[nodiscard]]
Result<Part_Map, Messages>
make_part_map(std::span<const Part> parts, std::pmr::memory_resource* memory);

namespace detail {

using Names_Provider = Function_Ref<std::pmr::vector<std::u8string_view>()>;

/// @brief Logs that no directive named `name` exists,
/// and suggests the closest name among `registered_names()`, if any is close enough.
/// `registered_names` is only invoked if the suggestion can be logged.
void log_lookup_failure(
    std::u8string_view message,
    std::u8string_view name,
    Names_Provider registered_names,
    const Source_Span& location,
    const Parse_Options& options
);

void log_directive_error(
    std::u8string_view id,
    std::u8string_view message,
    const Source_Span& location,
    const Parse_Options& options
);

/// @brief Executes a directive which requires a `Document_Cursor`,
/// once the document tree is complete.
template <typename Context, typename Element>
struct Deferred_Directive final : ast::Resolver<Element> {
private:
    const Directive_Behavior<Context, Element>& m_directive;
    const Directive_Kind<Context, Element>& m_kind;
    typename Context::parser_type& m_parser;
    std::pmr::u8string m_name;
    Part_Map m_parts;
    std::pmr::u8string m_fallback;
    Source_Span m_location;

public:
    [[nodiscard]]
    Deferred_Directive(
        const Directive_Behavior<Context, Element>& directive,
        const Directive_Kind<Context, Element>& kind,
        typename Context::parser_type& parser,
        std::pmr::u8string&& name,
        Part_Map&& parts,
        std::u8string_view fallback,
        const Source_Span& location
    )
        : m_directive { directive }
        , m_kind { kind }
        , m_parser { parser }
        , m_name { std::move(name) }
        , m_parts { std::move(parts) }
        , m_fallback { fallback, m_name.get_allocator() }
        , m_location { location }
    {
    }

    [[nodiscard]]
    Element resolve(const Document_Cursor& cursor) const final
    {
        std::pmr::memory_resource* const memory = m_name.get_allocator().resource();
        const Context context { m_parts, &cursor, m_parser, m_location, memory };
        Directive_Result<Element> result = m_directive(context);
        if (result) {
            return std::move(*result);
        }
        const std::pmr::u8string message = invalid_directive_message(m_name, result.error(), memory);
        return m_kind.make_invalid(message, m_fallback, memory);
    }
};

} // namespace detail

/// @brief Resolves `directive` against `registry` and converts it into a tree element.
///
/// If the directive is not registered, has duplicate parts, or reports errors when executed,
/// the result is an invalid element and the errors are logged.
/// If the directive requires a `Document_Cursor`,
/// the result is a placeholder which executes the directive once resolved.
/// In that case, `registry`, its directives, `kind`, and `site.parser` must outlive the
/// placeholder.
template <typename Context, typename Element>
[[nodiscard]]
Element apply_directive(
    Parsed_Directive&& directive,
    const Directive_Registry<Directive_Behavior<Context, Element>>& registry,
    const Directive_Kind<Context, Element>& kind,
    const Directive_Site<Context>& site
)
{
    std::pmr::memory_resource* const memory = site.options.memory;
    Messages messages { memory };

    const Directive_Behavior<Context, Element>* const behavior = registry.find(directive.name);
    if (!behavior) {
        std::pmr::u8string message = lookup_failure_message(kind.label, directive.name, memory);
        const auto registered_names = [&] { return registry.names(memory); };
        detail::log_lookup_failure(
            message, directive.name, registered_names, site.location, site.options
        );
        messages.push_back(std::move(message));
    }

    Result<Part_Map, Messages> parts = make_part_map(directive.parts, memory);
    if (!parts) {
        for (std::pmr::u8string& message : parts.error()) {
            detail::log_directive_error(
                diagnostic::directive_duplicate_part, message, site.location, site.options
            );
            messages.push_back(std::move(message));
        }
    }

    if (!messages.empty()) {
        const std::pmr::u8string message
            = invalid_directive_message(directive.name, messages, memory);
        return kind.make_invalid(message, site.fallback, memory);
    }

    if (behavior->requires_context()) {
        auto resolver = std::make_unique<detail::Deferred_Directive<Context, Element>>(
            *behavior, kind, site.parser, std::move(directive.name), std::move(*parts),
            site.fallback, site.location
        );
        return kind.make_placeholder(std::move(resolver), site.location);
    }

    const Context context { *parts, nullptr, site.parser, site.location, memory };
    Directive_Result<Element> result = (*behavior)(context);
    if (result) {
        return std::move(*result);
    }
    const std::pmr::u8string message
        = invalid_directive_message(directive.name, result.error(), memory);
    detail::log_directive_error(diagnostic::directive_execution, message, site.location, site.options);
    return kind.make_invalid(message, site.fallback, memory);
}

} // namespace lamp

#endif
