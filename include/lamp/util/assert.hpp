#ifndef LAMP_ASSERT_HPP
#define LAMP_ASSERT_HPP

#include "ulight/impl/assert.hpp"

// Assertions are checked by µlight, which reports failures through its assertion handler.

#define LAMP_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define LAMP_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)
#define LAMP_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif
