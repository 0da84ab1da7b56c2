#pragma once

// CLI parser for `relaunch`.
//
// Pure: no process or logging side effects. Tokens are consumed left to
// right; an unknown token is an error. A new instance is always started
// without arguments, so it never inherits `--new-instance`.

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace rl::cli
{
    struct ParseError final
    {
        std::string message;
    };

    class LaunchArguments final
    {
    public:
        static constexpr std::string_view new_instance_arg = "--new-instance";
        static constexpr std::string_view count_arg = "--count";
        static constexpr std::string_view dry_run_arg = "--dry-run";
        static constexpr std::string_view help_arg = "--help";
        static constexpr std::string_view help_short_arg = "-h";

        static constexpr std::uint32_t max_count = 64;

        // `args` excludes argv[0].
        [[nodiscard]] static std::expected<LaunchArguments, ParseError> parse(std::span<const std::string> args) noexcept;

        [[nodiscard]] static std::string usage();

        [[nodiscard]] bool new_instance_requested() const noexcept;
        [[nodiscard]] std::uint32_t count() const noexcept;
        [[nodiscard]] bool dry_run() const noexcept;
        [[nodiscard]] bool help_requested() const noexcept;

    private:
        LaunchArguments() = default;

        bool _new_instance{ false };
        bool _count_given{ false };
        std::uint32_t _count{ 1 };
        bool _dry_run{ false };
        bool _help{ false };
    };
}
