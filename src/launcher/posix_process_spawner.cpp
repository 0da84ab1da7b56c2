#include "launcher/process_spawner.hpp"

#include <signal.h>
#include <spawn.h>
#include <sys/types.h>

#include <new>
#include <string>
#include <vector>

extern char** environ;

namespace rl::launcher
{
    namespace
    {
        // Signals commonly ignored by a host process; the new instance starts
        // with their default dispositions.
        constexpr int reset_signals[] = { SIGHUP, SIGINT, SIGQUIT, SIGPIPE, SIGTERM, SIGCHLD };

        // Spawn attributes that give the child an empty signal mask and
        // default dispositions instead of the caller's signal state.
        class SpawnAttributes final
        {
        public:
            SpawnAttributes() noexcept = default;

            ~SpawnAttributes() noexcept
            {
                if (_initialized)
                {
                    (void)::posix_spawnattr_destroy(&_attributes);
                }
            }

            SpawnAttributes(const SpawnAttributes&) = delete;
            SpawnAttributes& operator=(const SpawnAttributes&) = delete;

            // Returns 0 or the errno value of the failing call.
            [[nodiscard]] int initialize() noexcept
            {
                if (const int error = ::posix_spawnattr_init(&_attributes); error != 0)
                {
                    return error;
                }
                _initialized = true;

                sigset_t empty_mask;
                ::sigemptyset(&empty_mask);
                if (const int error = ::posix_spawnattr_setsigmask(&_attributes, &empty_mask); error != 0)
                {
                    return error;
                }

                sigset_t defaults;
                ::sigemptyset(&defaults);
                for (const int signal_number : reset_signals)
                {
                    ::sigaddset(&defaults, signal_number);
                }
                if (const int error = ::posix_spawnattr_setsigdefault(&_attributes, &defaults); error != 0)
                {
                    return error;
                }

                return ::posix_spawnattr_setflags(&_attributes, static_cast<short>(POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF));
            }

            [[nodiscard]] const posix_spawnattr_t* get() const noexcept
            {
                return &_attributes;
            }

        private:
            posix_spawnattr_t _attributes{};
            bool _initialized{ false };
        };
    }

    std::expected<ProcessId, LaunchError> PosixProcessSpawner::spawn(const LaunchCommand& command) noexcept
    {
        try
        {
            const std::string program = command.program.string();
            if (program.empty())
            {
                return std::unexpected(make_os_error(LaunchErrorKind::process_creation, std::make_error_code(std::errc::invalid_argument)));
            }

            // posix_spawn takes `char* const[]`; the strings outlive the call.
            std::vector<std::string> storage;
            storage.reserve(command.arguments.size() + 1);
            storage.push_back(program);
            storage.insert(storage.end(), command.arguments.begin(), command.arguments.end());

            std::vector<char*> argv;
            argv.reserve(storage.size() + 1);
            for (auto& value : storage)
            {
                argv.push_back(value.data());
            }
            argv.push_back(nullptr);

            SpawnAttributes attributes;
            if (const int error = attributes.initialize(); error != 0)
            {
                return std::unexpected(make_os_error(LaunchErrorKind::process_creation, std::error_code(error, std::generic_category())));
            }

            pid_t child = -1;
            const int result = command.search_path
                ? ::posix_spawnp(&child, program.c_str(), nullptr, attributes.get(), argv.data(), environ)
                : ::posix_spawn(&child, program.c_str(), nullptr, attributes.get(), argv.data(), environ);
            if (result != 0)
            {
                return std::unexpected(make_os_error(LaunchErrorKind::process_creation, std::error_code(result, std::generic_category())));
            }

            return static_cast<ProcessId>(child);
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
        return std::make_unique<PosixProcessSpawner>();
    }
}
