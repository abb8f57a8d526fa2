#pragma once

#include <cassert>
#include <cstdio>
#include <cstdlib>

/**
 * @file config.hpp
 * @brief Compile-time configuration hooks.
 * @details Both macros may be defined before including any sprout header to route
 * failures into a custom handler.
 *
 * - `SPROUT_ASSERT(expr, msg)` guards internal invariants. Compiled out with NDEBUG.
 * - `SPROUT_PANIC(msg)` reports logic errors made by the caller (duplicate spawn key,
 *   unknown spawn key, ...). Always enabled; a replacement must not return.
 */

#ifndef SPROUT_ASSERT
#define SPROUT_ASSERT(expr, msg) assert((expr) && (msg))
#endif

namespace sprout::detail {

[[noreturn]] inline void panic(const char* msg, const char* file, int line) {
    std::fprintf(stderr, "sprout: %s (%s:%d)\n", msg, file, line);
    std::fflush(stderr);
    std::abort();
}

} // namespace sprout::detail

#ifndef SPROUT_PANIC
#define SPROUT_PANIC(msg) ::sprout::detail::panic((msg), __FILE__, __LINE__)
#endif
