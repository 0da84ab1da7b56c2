#include "launcher/executable_path.hpp"

#include <filesystem>
#include <system_error>

namespace
{
    using rl::launcher::ExecutablePathResolver;

    bool test_resolves_existing_absolute_path()
    {
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
        const auto path = ExecutablePathResolver::resolve_current();
        if (!path)
        {
            return false;
        }

        std::error_code error;
        return path->is_absolute() && std::filesystem::is_regular_file(*path, error);
#else
        const auto path = ExecutablePathResolver::resolve_current();
        return !path && path.error().kind == rl::launcher::LaunchErrorKind::path_resolution;
#endif
    }

    bool test_resolves_to_the_test_binary()
    {
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
        const auto path = ExecutablePathResolver::resolve_current();
        return path && path->filename().string().starts_with("relaunch_tests");
#else
        return true;
#endif
    }

    bool test_repeated_resolution_is_stable()
    {
        const auto first = ExecutablePathResolver::resolve_current();
        const auto second = ExecutablePathResolver::resolve_current();
        if (first.has_value() != second.has_value())
        {
            return false;
        }
        return !first || *first == *second;
    }

    bool test_deleted_link_target_detection()
    {
        return ExecutablePathResolver::is_deleted_link_target("/opt/app/bin (deleted)") &&
               !ExecutablePathResolver::is_deleted_link_target("/opt/app/bin") &&
               !ExecutablePathResolver::is_deleted_link_target(" (deleted)");
    }
}

bool run_executable_path_tests()
{
    return test_resolves_existing_absolute_path() &&
           test_resolves_to_the_test_binary() &&
           test_repeated_resolution_is_stable() &&
           test_deleted_link_target_detection();
}
