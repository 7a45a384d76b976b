#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamp/util/assert.hpp"

#include "lamp/ast.hpp"
#include "lamp/builtin_directive_set.hpp"
#include "lamp/directive.hpp"
#include "lamp/document.hpp"

namespace lamp {

Directive_Result<ast::Span> Config_Behavior::operator()(const Span_Directive_Context& context) const
{
    LAMP_ASSERT(context.cursor);

    Messages errors { context.memory };
    const std::optional<std::u8string_view> key
        = require_part(context, Part_Kind::attribute, {}, errors);
    if (!errors.empty()) {
        return errors;
    }
    const std::optional<std::u8string_view> value = context.cursor->config_value(*key);
    if (!value) {
        std::pmr::u8string message { u8"No configuration value for key: ", context.memory };
        message += *key;
        errors.push_back(std::move(message));
        return errors;
    }
    return ast::make_text(*value, context.memory);
}

Directive_Result<ast::Block> Toc_Behavior::operator()(const Block_Directive_Context& context) const
{
    LAMP_ASSERT(context.cursor);

    ast::Block_Sequence result {
        .style = std::pmr::u8string { toc_style, context.memory },
        .content = std::pmr::vector<ast::Block> { context.memory },
    };
    for (const Document& document : context.cursor->tree.documents) {
        ast::Paragraph entry { .content = std::pmr::vector<ast::Span> { context.memory } };
        entry.content.push_back(ast::make_text(document.path, context.memory));
        result.content.push_back(std::move(entry));
    }
    return ast::Block { std::move(result) };
}

} // namespace lamp
