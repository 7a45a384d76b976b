#include <optional>
#include <string_view>

#include "lamp/ast.hpp"
#include "lamp/builtin_directive_set.hpp"
#include "lamp/directive.hpp"

namespace lamp {

Directive_Result<ast::Block>
Literal_Behavior::operator()(const Block_Directive_Context& context) const
{
    Messages errors { context.memory };
    const std::optional<std::u8string_view> body
        = require_part(context, Part_Kind::body, {}, errors);
    if (!errors.empty()) {
        return errors;
    }
    return ast::make_literal_block(*body, context.memory);
}

} // namespace lamp
