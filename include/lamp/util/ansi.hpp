#ifndef LAMP_ANSI_HPP
#define LAMP_ANSI_HPP

#include <string_view>

/// @brief The ANSI escape sequences used when printing diagnostics to a terminal.
namespace lamp::ansi {

inline constexpr std::u8string_view green = u8"\x1B[32m";

inline constexpr std::u8string_view h_black = u8"\x1B[0;90m";
inline constexpr std::u8string_view h_red = u8"\x1B[0;91m";
inline constexpr std::u8string_view h_yellow = u8"\x1B[0;93m";

inline constexpr std::u8string_view reset = u8"\033[0m";

} // namespace lamp::ansi

#endif
