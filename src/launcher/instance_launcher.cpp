#include "launcher/instance_launcher.hpp"

#include "core/assert.hpp"
#include "core/console_writer.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <exception>
#include <format>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace rl::launcher
{
    namespace
    {
        // Fits the small-string buffer, so building it never allocates.
        constexpr const char* out_of_memory_text = "out of memory";

        [[nodiscard]] LaunchError out_of_memory(const LaunchErrorKind kind) noexcept
        {
            return LaunchError{
                .kind = kind,
                .diagnostic = out_of_memory_text,
                .os_error = std::make_error_code(std::errc::not_enough_memory),
            };
        }

        [[nodiscard]] LaunchError unexpected_failure(const LaunchErrorKind kind, const char* const what) noexcept
        {
            try
            {
                return LaunchError{
                    .kind = kind,
                    .diagnostic = what,
                    .os_error = {},
                };
            }
            catch (const std::bad_alloc&)
            {
                return out_of_memory(kind);
            }
        }

        [[nodiscard]] std::string_view failure_prefix(const LaunchErrorKind kind) noexcept
        {
            switch (kind)
            {
            case LaunchErrorKind::path_resolution:
                return "Failed to get current executable path: ";
            case LaunchErrorKind::unsupported_platform:
                return "Unsupported platform";
            case LaunchErrorKind::process_creation:
            default:
                return "Failed to spawn new process: ";
            }
        }
    }

    InstanceLauncher::InstanceLauncher(logging::Logger& logger) :
        InstanceLauncher(
            logger,
            &ExecutablePathResolver::resolve_current,
            make_launch_strategy(current_host_platform()),
            make_host_process_spawner())
    {
    }

    InstanceLauncher::InstanceLauncher(
        logging::Logger& logger,
        const ExecutablePathSource path_source,
        std::unique_ptr<ILaunchStrategy> strategy,
        std::unique_ptr<IProcessSpawner> spawner) :
        _logger(logger),
        _path_source(path_source),
        _strategy(std::move(strategy)),
        _spawner(std::move(spawner))
    {
        _reserved_message.reserve(reserved_message_capacity);
        RL_ASSERT(_path_source != nullptr);
        RL_ASSERT(_strategy != nullptr);
        RL_ASSERT(_spawner != nullptr);
        _logger.log(logging::LogLevel::debug, "Launch strategy selected: {}", _strategy->name());
    }

    const ILaunchStrategy& InstanceLauncher::strategy() const noexcept
    {
        return *_strategy;
    }

    std::expected<LaunchCommand, LaunchError> InstanceLauncher::plan() const noexcept
    {
        try
        {
            auto executable = _path_source();
            if (!executable)
            {
                return std::unexpected(std::move(executable.error()));
            }

            _logger.log(logging::LogLevel::info, "Attempting to spawn new instance from: {}", executable->string());
            return _strategy->prepare(*executable);
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(out_of_memory(LaunchErrorKind::process_creation));
        }
        catch (const std::exception& ex)
        {
            return std::unexpected(unexpected_failure(LaunchErrorKind::process_creation, ex.what()));
        }
    }

    std::expected<ProcessId, LaunchError> InstanceLauncher::launch() noexcept
    {
        auto command = plan();
        if (!command)
        {
            return std::unexpected(std::move(command.error()));
        }

        auto spawned = _spawner->spawn(*command);
        if (!spawned)
        {
            return std::unexpected(std::move(spawned.error()));
        }

        return *spawned;
    }

    LaunchOutcome InstanceLauncher::launch_new_instance() noexcept
    {
        if (_reserved_message.capacity() < reserved_message_capacity)
        {
            try
            {
                _reserved_message.reserve(reserved_message_capacity);
            }
            catch (const std::bad_alloc&)
            {
                // reserved_outcome falls back to small-string messages.
            }
        }

        const auto result = launch();
        try
        {
            if (!result)
            {
                LaunchOutcome outcome = make_failure(result.error());
                report(logging::LogLevel::error, outcome_message(outcome));
                return outcome;
            }

            LaunchOutcome outcome = make_success(*result);
            report(logging::LogLevel::info, std::format("Successfully spawned new process with PID: {}", *result));
            return outcome;
        }
        catch (const std::exception&)
        {
            LaunchOutcome outcome = reserved_outcome(result);
            report(result ? logging::LogLevel::info : logging::LogLevel::error, outcome_message(outcome));
            return outcome;
        }
    }

    // Builds the outcome without allocating: the text goes into
    // `_reserved_message`, or into a small string when that is gone.
    LaunchOutcome InstanceLauncher::reserved_outcome(const std::expected<ProcessId, LaunchError>& result) noexcept
    {
        std::string message = std::move(_reserved_message);
        message.clear();
        const bool reserved = message.capacity() >= reserved_message_capacity;

        if (result)
        {
            // "New process spawned with PID: " plus at most 20 digits.
            std::array<char, 64> buffer{};
            constexpr std::string_view prefix = "New process spawned with PID: ";
            std::copy(prefix.begin(), prefix.end(), buffer.begin());
            const auto digits = std::to_chars(buffer.data() + prefix.size(), buffer.data() + buffer.size(), *result);
            const std::string_view text(buffer.data(), static_cast<size_t>(digits.ptr - buffer.data()));
            if (reserved)
            {
                message.assign(text);
            }
            else
            {
                // "PID " plus the digits stays within the small-string buffer for real pids.
                message = "PID ";
                message.append(text.substr(prefix.size()));
            }
            return LaunchSuccess{
                .process_id = *result,
                .message = std::move(message),
            };
        }

        const LaunchError& error = result.error();
        const std::string_view prefix = failure_prefix(error.kind);
        if (!reserved)
        {
            message = error.kind == LaunchErrorKind::unsupported_platform ? "Unsupported" : "Out of memory";
        }
        else if (error.kind == LaunchErrorKind::unsupported_platform)
        {
            message.assign(prefix);
        }
        else
        {
            message.assign(prefix);
            const std::string_view detail = error.diagnostic.empty() ? std::string_view(out_of_memory_text) : std::string_view(error.diagnostic);
            message.append(detail.size() <= message.capacity() - message.size() ? detail : std::string_view(out_of_memory_text));
        }

        return LaunchFailure{
            .kind = error.kind,
            .message = std::move(message),
        };
    }

    void InstanceLauncher::report(const logging::LogLevel level, const std::string_view message) const noexcept
    {
        try
        {
            _logger.log(level, "{}", message);
        }
        catch (const std::exception& ex)
        {
            core::write_console_line(ex.what());
        }
    }
}
