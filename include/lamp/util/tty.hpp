#ifndef LAMP_TTY_HPP
#define LAMP_TTY_HPP

#include <cstdio>

namespace lamp {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]]
bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stderr)` is `true`,
/// in which case diagnostics are printed with colors.
extern const bool is_stderr_tty;

} // namespace lamp

#endif
