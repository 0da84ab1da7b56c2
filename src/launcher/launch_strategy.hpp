#pragma once

// Per-platform launch strategies.
//
// A strategy only decides *what* to start for a given executable path; it
// never touches the OS. The chosen `LaunchCommand` is handed to an
// `IProcessSpawner`. The host strategy is picked once from the compile-time
// platform via `make_launch_strategy(current_host_platform())`.

#include "launcher/launch_types.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

namespace rl::launcher
{
    enum class HostPlatform
    {
        windows,
        macos,
        posix,
        unsupported,
    };

    [[nodiscard]] constexpr HostPlatform current_host_platform() noexcept
    {
#if defined(_WIN32)
        return HostPlatform::windows;
#elif defined(__APPLE__)
        return HostPlatform::macos;
#elif defined(__linux__) || defined(__unix__)
        return HostPlatform::posix;
#else
        return HostPlatform::unsupported;
#endif
    }

    [[nodiscard]] std::string_view to_string(HostPlatform platform) noexcept;

    class ILaunchStrategy
    {
    public:
        virtual ~ILaunchStrategy() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::expected<LaunchCommand, LaunchError> prepare(const std::filesystem::path& executable) const = 0;
    };

    // Starts the executable directly in a console of its own so closing the
    // parent's console cannot take the new instance down with it.
    class WindowsLaunchStrategy final : public ILaunchStrategy
    {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::expected<LaunchCommand, LaunchError> prepare(const std::filesystem::path& executable) const override;
    };

    // Goes through `open -n -a <path>`. Re-executing the binary inside an
    // app bundle does not register a separate application instance with
    // LaunchServices; `-n` forces a new instance even if one is running.
    class MacLaunchStrategy final : public ILaunchStrategy
    {
    public:
        static constexpr std::string_view launcher_utility = "open";
        static constexpr std::string_view new_instance_flag = "-n";
        static constexpr std::string_view application_flag = "-a";

        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::expected<LaunchCommand, LaunchError> prepare(const std::filesystem::path& executable) const override;
    };

    // Plain child process with default inheritance; it is never waited on.
    class PosixLaunchStrategy final : public ILaunchStrategy
    {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::expected<LaunchCommand, LaunchError> prepare(const std::filesystem::path& executable) const override;
    };

    class UnsupportedLaunchStrategy final : public ILaunchStrategy
    {
    public:
        [[nodiscard]] std::string_view name() const noexcept override;
        [[nodiscard]] std::expected<LaunchCommand, LaunchError> prepare(const std::filesystem::path& executable) const override;
    };

    [[nodiscard]] std::unique_ptr<ILaunchStrategy> make_launch_strategy(HostPlatform platform);
}
