#include "launcher/launch_types.hpp"

#include "core/assert.hpp"

#include <format>

namespace rl::launcher
{
    LaunchError make_os_error(const LaunchErrorKind kind, const std::error_code error)
    {
        return LaunchError{
            .kind = kind,
            .diagnostic = error.message(),
            .os_error = error,
        };
    }

    std::string describe(const LaunchError& error)
    {
        switch (error.kind)
        {
        case LaunchErrorKind::path_resolution:
            return std::format("Failed to get current executable path: {}", error.diagnostic);
        case LaunchErrorKind::process_creation:
            return std::format("Failed to spawn new process: {}", error.diagnostic);
        case LaunchErrorKind::unsupported_platform:
            return "Unsupported platform";
        default:
            return std::format("Launch failed: {}", error.diagnostic);
        }
    }

    std::string escape_argument(const std::string_view argument)
    {
        if (argument.empty())
        {
            return "\"\"";
        }

        bool has_space = false;
        bool needs_escape = false;
        for (const auto ch : argument)
        {
            if (ch == '"')
            {
                needs_escape = true;
            }
            if (ch == ' ' || ch == '\t')
            {
                has_space = true;
            }
        }

        if (!has_space && !needs_escape)
        {
            return std::string{ argument };
        }

        std::string escaped;
        escaped.reserve(argument.size() + 2);

        if (has_space)
        {
            escaped.push_back('"');
        }

        size_t slash_count = 0;
        for (const auto ch : argument)
        {
            if (ch == '\\')
            {
                ++slash_count;
                escaped.push_back('\\');
                continue;
            }

            if (ch == '"')
            {
                for (; slash_count > 0; --slash_count)
                {
                    escaped.push_back('\\');
                }
                escaped.push_back('\\');
                escaped.push_back('"');
                continue;
            }

            slash_count = 0;
            escaped.push_back(ch);
        }

        if (has_space)
        {
            // Trailing backslashes must not escape the closing quote.
            for (; slash_count > 0; --slash_count)
            {
                escaped.push_back('\\');
            }
            escaped.push_back('"');
        }

        return escaped;
    }

    std::string format_command(const LaunchCommand& command)
    {
        std::string text = escape_argument(command.program.string());
        for (const auto& argument : command.arguments)
        {
            text.push_back(' ');
            text.append(escape_argument(argument));
        }
        if (command.new_console)
        {
            text.append(" [new console]");
        }
        return text;
    }

    std::string_view to_string(const LaunchErrorKind kind) noexcept
    {
        switch (kind)
        {
        case LaunchErrorKind::path_resolution:
            return "path_resolution";
        case LaunchErrorKind::process_creation:
            return "process_creation";
        case LaunchErrorKind::unsupported_platform:
            return "unsupported_platform";
        default:
            return "unknown";
        }
    }

    LaunchOutcome make_success(const ProcessId process_id)
    {
        return LaunchSuccess{
            .process_id = process_id,
            .message = std::format("New process spawned with PID: {}", process_id),
        };
    }

    LaunchOutcome make_failure(const LaunchError& error)
    {
        LaunchFailure failure{
            .kind = error.kind,
            .message = describe(error),
        };
        RL_ASSERT(!failure.message.empty());
        return failure;
    }

    bool succeeded(const LaunchOutcome& outcome) noexcept
    {
        return std::holds_alternative<LaunchSuccess>(outcome);
    }

    const std::string& outcome_message(const LaunchOutcome& outcome) noexcept
    {
        if (const auto* success = std::get_if<LaunchSuccess>(&outcome))
        {
            return success->message;
        }
        return std::get<LaunchFailure>(outcome).message;
    }
}
