#pragma once

// Starts another, fully independent copy of the running application.
//
// Each call resolves the executable path afresh, asks the platform strategy
// for a launch command and makes exactly one spawn attempt. Nothing is
// cached between calls and no state is shared, so concurrent calls are
// independent and every call is a fresh spawn attempt.
//
// Failures never escape as exceptions: `launch` reports a `LaunchError`
// and `launch_new_instance` turns it into a `LaunchFailure` message.

#include "launcher/executable_path.hpp"
#include "launcher/launch_strategy.hpp"
#include "launcher/launch_types.hpp"
#include "launcher/process_spawner.hpp"
#include "logging/logger.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace rl::launcher
{
    class InstanceLauncher final
    {
    public:
        // Host strategy, host spawner and the real executable path.
        explicit InstanceLauncher(logging::Logger& logger);

        InstanceLauncher(
            logging::Logger& logger,
            ExecutablePathSource path_source,
            std::unique_ptr<ILaunchStrategy> strategy,
            std::unique_ptr<IProcessSpawner> spawner);

        [[nodiscard]] LaunchOutcome launch_new_instance() noexcept;
        [[nodiscard]] std::expected<ProcessId, LaunchError> launch() noexcept;

        // Resolves the path and prepares the command without spawning.
        [[nodiscard]] std::expected<LaunchCommand, LaunchError> plan() const noexcept;

        [[nodiscard]] const ILaunchStrategy& strategy() const noexcept;

    private:
        // Storage for an outcome message built when allocation fails.
        static constexpr size_t reserved_message_capacity = 256;

        void report(logging::LogLevel level, std::string_view message) const noexcept;
        [[nodiscard]] LaunchOutcome reserved_outcome(const std::expected<ProcessId, LaunchError>& result) noexcept;

        logging::Logger& _logger;
        ExecutablePathSource _path_source;
        std::unique_ptr<ILaunchStrategy> _strategy;
        std::unique_ptr<IProcessSpawner> _spawner;
        std::string _reserved_message;
    };
}
