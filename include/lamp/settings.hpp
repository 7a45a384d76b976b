#ifndef LAMP_SETTINGS_HPP
#define LAMP_SETTINGS_HPP

#include <cstddef>

namespace lamp {

/// @brief The default limit for how deeply braces within a directive body may nest,
/// and for how deeply directive bodies may be parsed recursively.
/// This bounds the recursion depth of the parsers on adversarial input.
inline constexpr std::size_t default_max_nesting_depth = 64;

/// @brief The Levenshtein distance up to which a registered directive name is suggested
/// as a correction for an unknown directive name.
inline constexpr std::size_t max_typo_suggestion_distance = 3;

/// @brief The minimum indentation, in spaces or tabs,
/// of the continuation lines in the body of a block directive.
inline constexpr std::size_t min_block_body_indentation = 1;

} // namespace lamp

#endif
