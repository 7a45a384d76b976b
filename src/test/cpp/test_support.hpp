#ifndef LAMP_TEST_SUPPORT_HPP
#define LAMP_TEST_SUPPORT_HPP

#include <cstddef>
#include <memory_resource>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "lamp/util/source_position.hpp"
#include "lamp/util/strings.hpp"

#include "lamp/ast.hpp"
#include "lamp/directive.hpp"
#include "lamp/print.hpp"

namespace lamp {

[[nodiscard]]
inline std::pmr::u8string dump(std::span<const ast::Span> spans)
{
    std::pmr::u8string result;
    dump_spans(result, spans);
    return result;
}

[[nodiscard]]
inline std::pmr::u8string dump(std::span<const ast::Block> blocks)
{
    std::pmr::u8string result;
    dump_blocks(result, blocks);
    return result;
}

/// @brief A directive whose behavior is given by a function,
/// and which counts how often it has been executed.
template <typename Context, typename Element>
struct Test_Directive final : Directive_Behavior<Context, Element> {
    using Function = Directive_Result<Element> (*)(const Context&);

    Function function;
    mutable std::size_t calls = 0;

    [[nodiscard]]
    explicit Test_Directive(
        Function function,
        Context_Requirement requirement = Context_Requirement::none
    )
        : Directive_Behavior<Context, Element> { requirement }
        , function { function }
    {
    }

    [[nodiscard]]
    Directive_Result<Element> operator()(const Context& context) const final
    {
        ++calls;
        return function(context);
    }
};

using Test_Span_Directive = Test_Directive<Span_Directive_Context, ast::Span>;
using Test_Block_Directive = Test_Directive<Block_Directive_Context, ast::Block>;

/// @brief A `Recursive_Parsers` which turns every body into a single text span
/// or a single literal block.
struct Literal_Parsers final : Recursive_Parsers {
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();

    [[nodiscard]]
    std::pmr::vector<ast::Span> parse_spans(std::u8string_view source, const Source_Span&) final
    {
        std::pmr::vector<ast::Span> result { memory };
        result.push_back(ast::make_text(source, memory));
        return result;
    }

    [[nodiscard]]
    std::pmr::vector<ast::Block> parse_blocks(std::u8string_view source, const Source_Span&) final
    {
        std::pmr::vector<ast::Block> result { memory };
        result.push_back(ast::make_literal_block(source, memory));
        return result;
    }
};

} // namespace lamp

#endif
