#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "lamp/directive.hpp"

namespace lamp {

std::pmr::u8string describe(const Part_Key& key, std::pmr::memory_resource* memory)
{
    const std::u8string_view kind = key.kind == Part_Kind::attribute ? u8"attribute" : u8"body";
    std::pmr::u8string result { memory };
    if (key.is_default()) {
        result += u8"default ";
        result += kind;
    }
    else {
        result += kind;
        result += u8": ";
        result += key.name;
    }
    return result;
}

std::optional<std::u8string_view>
Directive_Context_Base::part(Part_Kind kind, std::u8string_view name) const
{
    // Part_Map has no transparent comparator because its keys are pairs,
    // so we have to build a key to search for.
    const Part_Key key { kind, std::pmr::u8string { name, memory } };
    const auto it = parts.find(key);
    if (it == parts.end()) {
        return {};
    }
    return std::u8string_view { it->second };
}

} // namespace lamp
