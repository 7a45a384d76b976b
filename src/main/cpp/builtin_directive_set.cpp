#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lamp/builtin_directive_set.hpp"
#include "lamp/directive.hpp"

namespace lamp {

namespace {

template <typename Directive, std::size_t N>
[[nodiscard]]
Directive_Registry<Directive> make_registry(
    const std::pair<std::u8string_view, const Directive*> (&entries)[N],
    std::pmr::memory_resource* memory
)
{
    return Directive_Registry<Directive> { entries, memory };
}

} // namespace

std::optional<std::u8string_view> require_part(
    const Directive_Context_Base& context,
    Part_Kind kind,
    std::u8string_view name,
    Messages& errors
)
{
    std::optional<std::u8string_view> result = context.part(kind, name);
    if (!result) {
        const Part_Key key { kind, std::pmr::u8string { name, context.memory } };
        std::pmr::u8string message { u8"required ", context.memory };
        message += describe(key, context.memory);
        message += u8" is missing";
        errors.push_back(std::move(message));
    }
    return result;
}

Builtin_Directive_Set::Builtin_Directive_Set(std::pmr::memory_resource* memory)
    : m_span_directives { make_registry<Span_Directive>(
          {
              { u8"style", &m_style },
              { u8"config", &m_config },
          },
          memory
      ) }
    , m_block_directives { make_registry<Block_Directive>(
          {
              { u8"box", &m_box },
              { u8"toc", &m_toc },
              { u8"literal", &m_literal },
          },
          memory
      ) }
    , m_template_directives { make_registry<Span_Directive>(
          {
              { u8"style", &m_style },
              { u8"config", &m_config },
          },
          memory
      ) }
{
}

} // namespace lamp
