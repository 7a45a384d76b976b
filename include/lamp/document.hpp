#ifndef LAMP_DOCUMENT_HPP
#define LAMP_DOCUMENT_HPP

#include <functional>
#include <map>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lamp/ast.hpp"
#include "lamp/fwd.hpp"

namespace lamp {

/// @brief A mapping of configuration keys to values,
/// which is searchable using `std::u8string_view`.
using Config = std::pmr::map<std::pmr::u8string, std::pmr::u8string, std::less<>>;

struct Document {
    std::pmr::u8string path;
    /// @brief The configuration from the `{% ... %}` header of the document.
    Config config;
    std::pmr::vector<ast::Block> content;
};

struct Document_Tree {
    /// @brief The configuration shared by all documents,
    /// which is overridden by the configuration of each document.
    Config config;
    std::pmr::vector<Document> documents;
};

/// @brief A read-only view of the complete document tree,
/// positioned at the document in which a placeholder or reference is resolved.
struct Document_Cursor {
    const Document_Tree& tree;
    const Document& document;

    /// @brief Returns the configuration value for `key`,
    /// looking first in the document and then in the tree.
    [[nodiscard]]
    std::optional<std::u8string_view> config_value(std::u8string_view key) const;

    /// @brief Returns the value of the reference `{{name}}`.
    /// `document.path` is the path of the current document,
    /// `config.key` and `key` are configuration values.
    [[nodiscard]]
    std::optional<std::u8string_view> resolve_reference(std::u8string_view name) const;
};

} // namespace lamp

#endif
