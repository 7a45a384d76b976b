#ifndef LAMP_DIRECTIVE_PARSING_HPP
#define LAMP_DIRECTIVE_PARSING_HPP

#include <memory_resource>
#include <string>
#include <vector>

#include "lamp/directive.hpp"
#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief The name and attributes of a directive.
struct Directive_Declaration {
    std::pmr::u8string name;
    /// @brief The default attribute (if any), followed by the named attributes in declaration
    /// order.
    std::pmr::vector<Part> attributes;
};

enum struct Start_Char_Policy : bool {
    /// @brief The directive begins with `:`, because `@` was already consumed,
    /// such as by the inline parser which dispatched on it.
    exclude,
    /// @brief The directive begins with `@:`.
    include,
};

/// @brief Parses a directive declaration, consisting of
/// `:`, a name, an optional default attribute, and any amount of named attributes.
/// Trailing spaces and tabs are consumed.
/// For example, `:image "cat.png" width=100`.
[[nodiscard]]
Parsed<Directive_Declaration>
parse_directive_declaration(const Parse_Input& input, std::pmr::memory_resource* memory);

/// @brief Parses an attribute value, which is either a quoted string with backslash escapes
/// or a non-empty run of ASCII characters other than whitespace, `.`, and `:`.
[[nodiscard]]
Parsed<std::pmr::u8string>
parse_attribute_value(const Parse_Input& input, std::pmr::memory_resource* memory);

/// @brief Parses a complete directive,
/// consisting of a declaration followed either by `.` (no bodies)
/// or by `:` and at least one body.
/// The first body may be the default body,
/// and every following body is a named body in the form `~name:`.
/// @param body_content Parses the content of a single body.
/// The surrounding grammar decides what a body looks like, such as text in braces.
/// @param policy Whether the leading `@` is part of the directive.
[[nodiscard]]
Parsed<Parsed_Directive> parse_directive(
    const Parse_Input& input,
    Parser_Ref<std::pmr::u8string> body_content,
    Start_Char_Policy policy,
    std::pmr::memory_resource* memory
);

} // namespace lamp

#endif
