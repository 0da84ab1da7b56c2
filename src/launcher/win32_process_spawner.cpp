#include "launcher/process_spawner.hpp"

#include "core/unique_resource.hpp"

#include <Windows.h>

#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace rl::launcher
{
    namespace
    {
        [[nodiscard]] LaunchError last_error() noexcept
        {
            const DWORD error = ::GetLastError();
            try
            {
                return make_os_error(LaunchErrorKind::process_creation, std::error_code(static_cast<int>(error), std::system_category()));
            }
            catch (const std::bad_alloc&)
            {
                return LaunchError{
                    .kind = LaunchErrorKind::process_creation,
                    .diagnostic = {},
                    .os_error = std::error_code(static_cast<int>(error), std::system_category()),
                };
            }
        }

        [[nodiscard]] std::expected<std::wstring, LaunchError> widen_utf8(const std::string_view text)
        {
            if (text.empty())
            {
                return std::wstring{};
            }

            const int wide_length = ::MultiByteToWideChar(
                CP_UTF8,
                MB_ERR_INVALID_CHARS,
                text.data(),
                static_cast<int>(text.size()),
                nullptr,
                0);
            if (wide_length <= 0)
            {
                return std::unexpected(last_error());
            }

            std::wstring wide(static_cast<size_t>(wide_length), L'\0');
            const int converted = ::MultiByteToWideChar(
                CP_UTF8,
                MB_ERR_INVALID_CHARS,
                text.data(),
                static_cast<int>(text.size()),
                wide.data(),
                wide_length);
            if (converted != wide_length)
            {
                return std::unexpected(last_error());
            }

            return wide;
        }
    }

    std::expected<ProcessId, LaunchError> Win32ProcessSpawner::spawn(const LaunchCommand& command) noexcept
    {
        try
        {
            const std::wstring program = command.program.wstring();
            if (program.empty())
            {
                return std::unexpected(make_os_error(LaunchErrorKind::process_creation, std::make_error_code(std::errc::invalid_argument)));
            }

            // argv[0] is always quoted; the rest uses CommandLineToArgvW rules.
            std::wstring command_line;
            command_line.push_back(L'"');
            command_line.append(program);
            command_line.push_back(L'"');
            for (const auto& argument : command.arguments)
            {
                auto wide = widen_utf8(escape_argument(argument));
                if (!wide)
                {
                    return std::unexpected(wide.error());
                }
                command_line.push_back(L' ');
                command_line.append(*wide);
            }

            // `CreateProcessW` requires a mutable command line buffer.
            std::vector<wchar_t> mutable_command_line(command_line.begin(), command_line.end());
            mutable_command_line.push_back(L'\0');

            STARTUPINFOW startup_info{};
            startup_info.cb = sizeof(startup_info);

            const DWORD creation_flags = CREATE_UNICODE_ENVIRONMENT | (command.new_console ? CREATE_NEW_CONSOLE : 0);

            PROCESS_INFORMATION process_info{};
            const BOOL create_result = ::CreateProcessW(
                command.search_path ? nullptr : program.c_str(),
                mutable_command_line.data(),
                nullptr,
                nullptr,
                FALSE,
                creation_flags,
                nullptr,
                nullptr,
                &startup_info,
                &process_info);
            if (create_result == FALSE)
            {
                return std::unexpected(last_error());
            }

            // The new instance is not tracked; release our references at once.
            core::UniqueHandle process_handle(process_info.hProcess);
            core::UniqueHandle thread_handle(process_info.hThread);

            return static_cast<ProcessId>(process_info.dwProcessId);
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(LaunchError{
                .kind = LaunchErrorKind::process_creation,
                .diagnostic = "out of memory",
                .os_error = std::make_error_code(std::errc::not_enough_memory),
            });
        }
    }

    std::unique_ptr<IProcessSpawner> make_host_process_spawner()
    {
        return std::make_unique<Win32ProcessSpawner>();
    }
}
