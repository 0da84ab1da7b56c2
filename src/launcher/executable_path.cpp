#include "launcher/executable_path.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <new>
#include <string>

#if defined(_WIN32)
#include <Windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <cstdint>
#include <vector>
#elif defined(__linux__)
#include <unistd.h>
#endif

namespace rl::launcher
{
    namespace
    {
        constexpr std::string_view kDeletedSuffix = " (deleted)";
        constexpr size_t kMaxPathCharacters = 32 * 1024;

        [[nodiscard]] LaunchError path_error(const std::error_code error)
        {
            return make_os_error(LaunchErrorKind::path_resolution, error);
        }

#if defined(_WIN32)
        [[nodiscard]] std::expected<std::filesystem::path, LaunchError> query_module_path()
        {
            // Avoid MAX_PATH by growing the buffer until GetModuleFileNameW fits.
            std::wstring buffer(256, L'\0');
            for (;;)
            {
                const DWORD written = ::GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
                if (written == 0)
                {
                    return std::unexpected(path_error(std::error_code(static_cast<int>(::GetLastError()), std::system_category())));
                }

                if (written < buffer.size() - 1)
                {
                    buffer.resize(written);
                    return std::filesystem::path(buffer);
                }

                if (buffer.size() >= kMaxPathCharacters)
                {
                    return std::unexpected(path_error(std::error_code(ERROR_INSUFFICIENT_BUFFER, std::system_category())));
                }

                buffer.resize(buffer.size() * 2);
            }
        }
#elif defined(__APPLE__)
        [[nodiscard]] std::expected<std::filesystem::path, LaunchError> query_module_path()
        {
            std::uint32_t size = 0;
            (void)::_NSGetExecutablePath(nullptr, &size);

            std::vector<char> buffer(static_cast<size_t>(size) + 1, '\0');
            if (::_NSGetExecutablePath(buffer.data(), &size) != 0)
            {
                return std::unexpected(path_error(std::make_error_code(std::errc::filename_too_long)));
            }

            // _NSGetExecutablePath may return a path through symlinks or with
            // "..". Canonicalize so the launcher sees the real bundle path.
            char resolved[PATH_MAX]{};
            if (::realpath(buffer.data(), resolved) == nullptr)
            {
                return std::unexpected(path_error(std::error_code(errno, std::generic_category())));
            }

            return std::filesystem::path(resolved);
        }
#elif defined(__linux__)
        [[nodiscard]] std::expected<std::filesystem::path, LaunchError> query_module_path()
        {
            std::string buffer(256, '\0');
            for (;;)
            {
                const ssize_t written = ::readlink("/proc/self/exe", buffer.data(), buffer.size());
                if (written < 0)
                {
                    return std::unexpected(path_error(std::error_code(errno, std::generic_category())));
                }

                // readlink does not terminate; a full buffer may be truncated.
                if (static_cast<size_t>(written) < buffer.size())
                {
                    buffer.resize(static_cast<size_t>(written));
                    break;
                }

                if (buffer.size() >= kMaxPathCharacters)
                {
                    return std::unexpected(path_error(std::make_error_code(std::errc::filename_too_long)));
                }

                buffer.resize(buffer.size() * 2);
            }

            std::error_code exists_error;
            if (ExecutablePathResolver::is_deleted_link_target(buffer) && !std::filesystem::exists(buffer, exists_error))
            {
                return std::unexpected(path_error(std::make_error_code(std::errc::no_such_file_or_directory)));
            }

            return std::filesystem::path(buffer);
        }
#else
        [[nodiscard]] std::expected<std::filesystem::path, LaunchError> query_module_path()
        {
            return std::unexpected(path_error(std::make_error_code(std::errc::function_not_supported)));
        }
#endif
    }

    std::expected<std::filesystem::path, LaunchError> ExecutablePathResolver::resolve_current() noexcept
    {
        try
        {
            auto path = query_module_path();
            if (!path)
            {
                return path;
            }

            if (!path->is_absolute())
            {
                return std::unexpected(path_error(std::make_error_code(std::errc::invalid_argument)));
            }

            return path;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(LaunchError{
                .kind = LaunchErrorKind::path_resolution,
                .diagnostic = "out of memory",
                .os_error = std::make_error_code(std::errc::not_enough_memory),
            });
        }
    }

    bool ExecutablePathResolver::is_deleted_link_target(const std::string_view target) noexcept
    {
        return target.size() > kDeletedSuffix.size() && target.ends_with(kDeletedSuffix);
    }
}
