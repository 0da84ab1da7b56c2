#pragma once

#include "launcher/launch_types.hpp"

#include <expected>
#include <memory>

namespace rl::launcher
{
    // Performs the single OS call that creates a process. Returns as soon as
    // the OS accepts or rejects the request; never waits for the child.
    class IProcessSpawner
    {
    public:
        virtual ~IProcessSpawner() = default;

        [[nodiscard]] virtual std::expected<ProcessId, LaunchError> spawn(const LaunchCommand& command) noexcept = 0;
    };

#if defined(_WIN32)
    // `CreateProcessW` without handle inheritance. `new_console` maps to
    // CREATE_NEW_CONSOLE.
    class Win32ProcessSpawner final : public IProcessSpawner
    {
    public:
        [[nodiscard]] std::expected<ProcessId, LaunchError> spawn(const LaunchCommand& command) noexcept override;
    };
#else
    // `posix_spawn` (or `posix_spawnp` when `search_path` is set) with the
    // caller's environment. `new_console` has no POSIX meaning and is ignored.
    class PosixProcessSpawner final : public IProcessSpawner
    {
    public:
        [[nodiscard]] std::expected<ProcessId, LaunchError> spawn(const LaunchCommand& command) noexcept override;
    };
#endif

    [[nodiscard]] std::unique_ptr<IProcessSpawner> make_host_process_spawner();
}
