#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lamp/ast.hpp"
#include "lamp/builtin_directive_set.hpp"
#include "lamp/directive.hpp"

namespace lamp {

Directive_Result<ast::Span> Style_Behavior::operator()(const Span_Directive_Context& context) const
{
    Messages errors { context.memory };
    const std::optional<std::u8string_view> style
        = require_part(context, Part_Kind::attribute, {}, errors);
    const std::optional<std::u8string_view> body
        = require_part(context, Part_Kind::body, {}, errors);
    if (!errors.empty()) {
        return errors;
    }
    return ast::Span { ast::Styled {
        .style = std::pmr::u8string { *style, context.memory },
        .content = context.parse_spans(*body),
    } };
}

Directive_Result<ast::Block> Box_Behavior::operator()(const Block_Directive_Context& context) const
{
    Messages errors { context.memory };
    const std::optional<std::u8string_view> body
        = require_part(context, Part_Kind::body, {}, errors);
    if (!errors.empty()) {
        return errors;
    }
    const std::u8string_view style = context.default_attribute().value_or(default_box_style);
    return ast::Block { ast::Block_Sequence {
        .style = std::pmr::u8string { style, context.memory },
        .content = context.parse_blocks(*body),
    } };
}

} // namespace lamp
