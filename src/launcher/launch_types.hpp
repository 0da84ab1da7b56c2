#pragma once

// Value types shared by the instance launcher, its strategies and spawners.
//
// Errors travel as `LaunchError` through `std::expected` so callers keep the
// kind. Text is produced only by `describe`, `make_success` and `make_failure`, which is the
// presentation boundary used by the application host.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace rl::launcher
{
    using ProcessId = std::int64_t;

    enum class LaunchErrorKind
    {
        path_resolution,
        process_creation,
        unsupported_platform,
    };

    struct LaunchError final
    {
        LaunchErrorKind kind{ LaunchErrorKind::process_creation };
        std::string diagnostic;
        std::error_code os_error;
    };

    // A spawn request as prepared by a launch strategy.
    struct LaunchCommand final
    {
        std::filesystem::path program;
        std::vector<std::string> arguments;
        bool search_path{ false };
        bool new_console{ false };
    };

    struct LaunchSuccess final
    {
        ProcessId process_id{ 0 };
        std::string message;
    };

    struct LaunchFailure final
    {
        LaunchErrorKind kind{ LaunchErrorKind::process_creation };
        std::string message;
    };

    using LaunchOutcome = std::variant<LaunchSuccess, LaunchFailure>;

    [[nodiscard]] LaunchError make_os_error(LaunchErrorKind kind, std::error_code error);
    [[nodiscard]] std::string describe(const LaunchError& error);
    // Win32 command-line quoting: the result tokenizes back to `argument`
    // under CommandLineToArgvW rules. Operates on bytes, so UTF-8 is kept.
    [[nodiscard]] std::string escape_argument(std::string_view argument);
    [[nodiscard]] std::string format_command(const LaunchCommand& command);
    [[nodiscard]] std::string_view to_string(LaunchErrorKind kind) noexcept;

    [[nodiscard]] LaunchOutcome make_success(ProcessId process_id);
    [[nodiscard]] LaunchOutcome make_failure(const LaunchError& error);

    [[nodiscard]] bool succeeded(const LaunchOutcome& outcome) noexcept;
    [[nodiscard]] const std::string& outcome_message(const LaunchOutcome& outcome) noexcept;
}
