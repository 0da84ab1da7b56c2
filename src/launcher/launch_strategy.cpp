#include "launcher/launch_strategy.hpp"

namespace rl::launcher
{
    std::string_view to_string(const HostPlatform platform) noexcept
    {
        switch (platform)
        {
        case HostPlatform::windows:
            return "windows";
        case HostPlatform::macos:
            return "macos";
        case HostPlatform::posix:
            return "posix";
        case HostPlatform::unsupported:
            return "unsupported";
        default:
            return "unknown";
        }
    }

    std::string_view WindowsLaunchStrategy::name() const noexcept
    {
        return "windows";
    }

    std::expected<LaunchCommand, LaunchError> WindowsLaunchStrategy::prepare(const std::filesystem::path& executable) const
    {
        return LaunchCommand{
            .program = executable,
            .arguments = {},
            .search_path = false,
            .new_console = true,
        };
    }

    std::string_view MacLaunchStrategy::name() const noexcept
    {
        return "macos";
    }

    std::expected<LaunchCommand, LaunchError> MacLaunchStrategy::prepare(const std::filesystem::path& executable) const
    {
        return LaunchCommand{
            .program = std::filesystem::path(launcher_utility),
            .arguments = {
                std::string(new_instance_flag),
                std::string(application_flag),
                executable.string(),
            },
            .search_path = true,
            .new_console = false,
        };
    }

    std::string_view PosixLaunchStrategy::name() const noexcept
    {
        return "posix";
    }

    std::expected<LaunchCommand, LaunchError> PosixLaunchStrategy::prepare(const std::filesystem::path& executable) const
    {
        return LaunchCommand{
            .program = executable,
            .arguments = {},
            .search_path = false,
            .new_console = false,
        };
    }

    std::string_view UnsupportedLaunchStrategy::name() const noexcept
    {
        return "unsupported";
    }

    std::expected<LaunchCommand, LaunchError> UnsupportedLaunchStrategy::prepare(const std::filesystem::path& /*executable*/) const
    {
        return std::unexpected(LaunchError{
            .kind = LaunchErrorKind::unsupported_platform,
            .diagnostic = {},
            .os_error = {},
        });
    }

    std::unique_ptr<ILaunchStrategy> make_launch_strategy(const HostPlatform platform)
    {
        switch (platform)
        {
        case HostPlatform::windows:
            return std::make_unique<WindowsLaunchStrategy>();
        case HostPlatform::macos:
            return std::make_unique<MacLaunchStrategy>();
        case HostPlatform::posix:
            return std::make_unique<PosixLaunchStrategy>();
        case HostPlatform::unsupported:
        default:
            return std::make_unique<UnsupportedLaunchStrategy>();
        }
    }
}
