#include <optional>
#include <string_view>

#include "lamp/document.hpp"

namespace lamp {

namespace {

[[nodiscard]]
std::optional<std::u8string_view> find_in(const Config& config, std::u8string_view key)
{
    const auto it = config.find(key);
    if (it == config.end()) {
        return {};
    }
    return std::u8string_view { it->second };
}

} // namespace

std::optional<std::u8string_view> Document_Cursor::config_value(std::u8string_view key) const
{
    if (const std::optional<std::u8string_view> local = find_in(document.config, key)) {
        return local;
    }
    return find_in(tree.config, key);
}

std::optional<std::u8string_view>
Document_Cursor::resolve_reference(std::u8string_view name) const
{
    static constexpr std::u8string_view config_prefix = u8"config.";

    if (name == u8"document.path") {
        return std::u8string_view { document.path };
    }
    if (name.starts_with(config_prefix)) {
        return config_value(name.substr(config_prefix.size()));
    }
    return config_value(name);
}

} // namespace lamp
