#pragma once

#include <cstdio>
#include <cstdlib>

namespace rl::core
{
    [[noreturn]] inline void fail_fast_assert(const char* expression, const char* file, const unsigned line) noexcept
    {
        std::fprintf(stderr, "[relaunch] assertion failed: %s (%s:%u)\n", expression, file, line);
        (void)std::fflush(stderr);
        std::abort();
    }
}

#define RL_ASSERT(expr) ((expr) ? static_cast<void>(0) : ::rl::core::fail_fast_assert(#expr, __FILE__, __LINE__))
