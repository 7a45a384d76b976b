#ifdef __unix__
#include "stdio.h" // NOLINT for fileno
#include <cstdio>
#include <unistd.h>
#endif

#include "lamp/util/tty.hpp"

namespace lamp {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return isatty(fileno(file)) != 0;
#else
    (void)file;
    return false;
#endif
}

const bool is_stderr_tty = is_tty(stderr);

} // namespace lamp
