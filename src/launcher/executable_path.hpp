#pragma once

#include "launcher/launch_types.hpp"

#include <expected>
#include <filesystem>
#include <string_view>

namespace rl::launcher
{
    // Source of the running binary's location. Replaceable so that callers
    // (and tests) can substitute a fixed or failing lookup.
    using ExecutablePathSource = std::expected<std::filesystem::path, LaunchError> (*)() noexcept;

    class ExecutablePathResolver final
    {
    public:
        // Queried on every call; the result is never cached because the
        // binary may be replaced on disk between launches.
        [[nodiscard]] static std::expected<std::filesystem::path, LaunchError> resolve_current() noexcept;

        // Linux reports an unlinked binary as "<path> (deleted)".
        [[nodiscard]] static bool is_deleted_link_target(std::string_view target) noexcept;
    };
}
