#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/chars.hpp"
#include "lamp/util/result.hpp"

#include "lamp/delimited_text.hpp"
#include "lamp/directive.hpp"
#include "lamp/directive_parsing.hpp"
#include "lamp/inline_parsing.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/parser.hpp"

namespace lamp {

namespace {

void skip_declaration_whitespace(Parser& p)
{
    p.match_while(is_declaration_whitespace);
}

/// @brief Matches `name ws* = ws*`, which begins a named attribute.
[[nodiscard]]
std::u8string_view match_attribute_name(Parser& p)
{
    auto attempt = p.attempt();
    const std::u8string_view name = p.match_name();
    if (name.empty()) {
        return {};
    }
    skip_declaration_whitespace(p);
    if (!p.expect(u8'=')) {
        return {};
    }
    skip_declaration_whitespace(p);
    attempt.commit();
    return name;
}

/// @brief Matches `~ name ws* :`, which begins a named body.
[[nodiscard]]
std::u8string_view match_body_name(Parser& p)
{
    auto attempt = p.attempt();
    if (!p.expect(u8'~')) {
        return {};
    }
    const std::u8string_view name = p.match_name();
    if (name.empty()) {
        return {};
    }
    p.match_while(is_indentation);
    if (!p.expect(u8':')) {
        return {};
    }
    attempt.commit();
    return name;
}

[[nodiscard]]
bool peek_named_body(Parser p)
{
    skip_declaration_whitespace(p);
    return !match_body_name(p).empty();
}

[[nodiscard]]
Part make_part(
    Part_Kind kind,
    std::u8string_view name,
    std::pmr::u8string&& content,
    std::pmr::memory_resource* memory
)
{
    return Part { .key = { kind, std::pmr::u8string { name, memory } },
                  .content = std::move(content) };
}

} // namespace

Parsed<std::pmr::u8string>
parse_attribute_value(const Parse_Input& input, std::pmr::memory_resource* memory)
{
    Parser p { input };
    if (p.expect(u8'"')) {
        return parse_escaped_text(p.input(), Text_Delimiter { .end = u8"\"" }, memory);
    }
    // Not match_while, because values may contain non-ASCII characters.
    const std::u8string_view rest = p.peek_all();
    const auto value_end = std::ranges::find_if_not(rest, is_unquoted_attribute_value);
    const std::u8string_view value = rest.substr(0, std::size_t(value_end - rest.begin()));
    if (value.empty()) {
        return p.error(u8"Expected an attribute value.");
    }
    p.advance_by(value.size());
    return Parse_Success<std::pmr::u8string> {
        .value = std::pmr::u8string { value, memory },
        .next = p.input(),
    };
}

Parsed<Directive_Declaration>
parse_directive_declaration(const Parse_Input& input, std::pmr::memory_resource* memory)
{
    Parser p { input };
    if (!p.expect(u8':')) {
        return p.error(u8"Expected ':' at the start of a directive.");
    }
    const std::u8string_view name = p.match_name();
    if (name.empty()) {
        return p.error(u8"Expected a directive name.");
    }
    skip_declaration_whitespace(p);

    Directive_Declaration result { .name = std::pmr::u8string { name, memory },
                                   .attributes = std::pmr::vector<Part> { memory } };

    // The default attribute is anything that is not the start of a named attribute.
    if (Parser lookahead = p; match_attribute_name(lookahead).empty()) {
        auto attempt = p.attempt();
        if (Result<std::pmr::u8string, Parse_Error> value
            = p.consume(parse_attribute_value(p.input(), memory))) {
            result.attributes.push_back(
                make_part(Part_Kind::attribute, {}, std::move(*value), memory)
            );
            skip_declaration_whitespace(p);
            attempt.commit();
        }
    }

    while (true) {
        auto attempt = p.attempt();
        skip_declaration_whitespace(p);
        const std::u8string_view attribute_name = match_attribute_name(p);
        if (attribute_name.empty()) {
            break;
        }
        Result<std::pmr::u8string, Parse_Error> value
            = p.consume(parse_attribute_value(p.input(), memory));
        if (!value) {
            break;
        }
        result.attributes.push_back(
            make_part(Part_Kind::attribute, attribute_name, std::move(*value), memory)
        );
        attempt.commit();
    }

    p.match_while(is_indentation);
    return Parse_Success<Directive_Declaration> { .value = std::move(result), .next = p.input() };
}

Parsed<Parsed_Directive> parse_directive(
    const Parse_Input& input,
    Parser_Ref<std::pmr::u8string> body_content,
    Start_Char_Policy policy,
    std::pmr::memory_resource* memory
)
{
    Parser p { input };
    if (policy == Start_Char_Policy::include && !p.expect(u8'@')) {
        return p.error(u8"Expected '@' at the start of a directive.");
    }
    Result<Directive_Declaration, Parse_Error> declaration
        = p.consume(parse_directive_declaration(p.input(), memory));
    if (!declaration) {
        return declaration.error();
    }

    Parsed_Directive result { .name = std::move(declaration->name),
                              .parts = std::move(declaration->attributes) };

    if (p.expect(u8'.')) {
        return Parse_Success<Parsed_Directive> { .value = std::move(result), .next = p.input() };
    }
    if (!p.expect(u8':')) {
        return p.error(u8"Expected '.' or ':' after the directive declaration.");
    }

    const std::size_t attribute_count = result.parts.size();

    if (!peek_named_body(p)) {
        auto attempt = p.attempt();
        if (Result<std::pmr::u8string, Parse_Error> body = p.consume(body_content(p.input()))) {
            result.parts.push_back(make_part(Part_Kind::body, {}, std::move(*body), memory));
            attempt.commit();
        }
    }

    while (true) {
        auto attempt = p.attempt();
        skip_declaration_whitespace(p);
        const std::u8string_view body_name = match_body_name(p);
        if (body_name.empty()) {
            break;
        }
        Result<std::pmr::u8string, Parse_Error> body = p.consume(body_content(p.input()));
        if (!body) {
            break;
        }
        result.parts.push_back(make_part(Part_Kind::body, body_name, std::move(*body), memory));
        attempt.commit();
    }

    if (result.parts.size() == attribute_count) {
        return p.error(u8"Expected at least one body after ':'.");
    }
    return Parse_Success<Parsed_Directive> { .value = std::move(result), .next = p.input() };
}

} // namespace lamp
