#pragma once

#include <cstdio>
#include <string_view>

namespace rl::core
{
    namespace detail
    {
        inline void write_line(std::FILE* const stream, const std::string_view message) noexcept
        {
            if (stream == nullptr)
            {
                return;
            }

            (void)std::fwrite(message.data(), 1, message.size(), stream);
            (void)std::fputc('\n', stream);
            (void)std::fflush(stream);
        }
    }

    // Diagnostics go to stderr so stdout only carries results.
    inline void write_console_line(const std::string_view message) noexcept
    {
        detail::write_line(stderr, message);
    }

    inline void write_output_line(const std::string_view message) noexcept
    {
        detail::write_line(stdout, message);
    }
}
