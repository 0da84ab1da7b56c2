#include "core/environment.hpp"

#include <cstdint>
#include <cstdlib>
#include <new>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>
#endif

namespace rl::core
{
    std::optional<std::string> read_environment(const std::string_view name)
    {
        const std::string key(name);
#ifdef _WIN32
        const DWORD required = ::GetEnvironmentVariableA(key.c_str(), nullptr, 0);
        if (required == 0)
        {
            return std::nullopt;
        }

        std::string value(required, '\0');
        const DWORD written = ::GetEnvironmentVariableA(key.c_str(), value.data(), required);
        if (written == 0 && ::GetLastError() == ERROR_ENVVAR_NOT_FOUND)
        {
            return std::nullopt;
        }

        value.resize(written);
        return value;
#else
        const char* const value = std::getenv(key.c_str());
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
#endif
    }

    bool write_environment(const std::string_view name, const std::optional<std::string>& value) noexcept
    {
        try
        {
            const std::string key(name);
#ifdef _WIN32
            return ::SetEnvironmentVariableA(key.c_str(), value ? value->c_str() : nullptr) != FALSE;
#else
            if (value)
            {
                return ::setenv(key.c_str(), value->c_str(), 1) == 0;
            }
            return ::unsetenv(key.c_str()) == 0;
#endif
        }
        catch (const std::bad_alloc&)
        {
            return false;
        }
    }

    std::int64_t current_process_id() noexcept
    {
#ifdef _WIN32
        return static_cast<std::int64_t>(::GetCurrentProcessId());
#else
        return static_cast<std::int64_t>(::getpid());
#endif
    }
}
