#ifndef LAMP_DIAGNOSTIC_HPP
#define LAMP_DIAGNOSTIC_HPP

#include <string_view>

#include "lamp/util/severity.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/fwd.hpp"

namespace lamp {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifiers for this diagnostic.
    std::u8string_view id;
    /// @brief The name of the file that the diagnostic refers to, possibly empty.
    std::u8string_view file;
    /// @brief The span of code that is responsible for this diagnostic.
    Source_Span location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// PARSING =========================================================================================

/// @brief The `{% ... %}` configuration header at the start of a document is malformed.
inline constexpr std::u8string_view config_header = u8"parse.config-header";

/// @brief Directive bodies or blocks are nested more deeply than permitted,
/// so the innermost content is kept as literal text.
inline constexpr std::u8string_view nesting_depth = u8"parse.nesting-depth";

// DIRECTIVE APPLICATION ===========================================================================

/// @brief No directive is registered under the name that was used.
inline constexpr std::u8string_view directive_lookup = u8"directive.lookup";

/// @brief Emitted alongside `directive_lookup`,
/// naming the registered directive closest to the name that was used.
inline constexpr std::u8string_view directive_lookup_suggestion = u8"directive.lookup.suggestion";

/// @brief The same attribute or body was provided more than once.
inline constexpr std::u8string_view directive_duplicate_part = u8"directive.duplicate-part";

/// @brief The directive was found, but its behavior reported one or more errors.
inline constexpr std::u8string_view directive_execution = u8"directive.execution";

// PLACEHOLDER RESOLUTION ==========================================================================

/// @brief A deferred directive failed when resolved against the document tree.
inline constexpr std::u8string_view placeholder_invalid = u8"placeholder.invalid";

/// @brief Resolving a placeholder produced another placeholder.
inline constexpr std::u8string_view placeholder_nested = u8"placeholder.nested";

/// @brief A `{{name}}` reference names no known value.
inline constexpr std::u8string_view reference_unresolved = u8"reference.unresolved";

} // namespace diagnostic

} // namespace lamp

#endif
