#include "core/environment.hpp"
#include "launcher/instance_launcher.hpp"
#include "launcher/process_spawner.hpp"
#include "core/unique_resource.hpp"
#include "scoped_environment.hpp"
#include "spawned_child.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>

#if defined(_WIN32)
#include <Windows.h>
#else
#include <cerrno>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

// These tests create real processes. Self-respawn runs only where the new
// instance inherits the environment (not through macOS `open`), so the
// spawned test binary sees the child guard and exits at once.

namespace
{
    using namespace rl::launcher;
    using rl::tests::ScopedEnvironmentVariable;

#if !defined(_WIN32)
    [[nodiscard]] std::optional<int> wait_for_status(const ProcessId pid)
    {
        int status = 0;
        pid_t waited = -1;
        do
        {
            waited = ::waitpid(static_cast<pid_t>(pid), &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited != static_cast<pid_t>(pid))
        {
            return std::nullopt;
        }
        return status;
    }

    [[nodiscard]] std::optional<int> wait_for_termination_signal(const ProcessId pid)
    {
        const auto status = wait_for_status(pid);
        if (!status || !WIFSIGNALED(*status))
        {
            return std::nullopt;
        }
        return WTERMSIG(*status);
    }

    // Blocks SIGTERM and ignores SIGPIPE for the lifetime of the object, the
    // way a host with a dedicated signal thread would.
    class ScopedHostSignalState final
    {
    public:
        ScopedHostSignalState() noexcept
        {
            sigset_t blocked;
            ::sigemptyset(&blocked);
            ::sigaddset(&blocked, SIGTERM);
            (void)::pthread_sigmask(SIG_BLOCK, &blocked, &_previous_mask);

            struct sigaction ignore{};
            ignore.sa_handler = SIG_IGN;
            ::sigemptyset(&ignore.sa_mask);
            (void)::sigaction(SIGPIPE, &ignore, &_previous_pipe_action);
        }

        ~ScopedHostSignalState() noexcept
        {
            (void)::sigaction(SIGPIPE, &_previous_pipe_action, nullptr);
            (void)::pthread_sigmask(SIG_SETMASK, &_previous_mask, nullptr);
        }

        ScopedHostSignalState(const ScopedHostSignalState&) = delete;
        ScopedHostSignalState& operator=(const ScopedHostSignalState&) = delete;

    private:
        sigset_t _previous_mask{};
        struct sigaction _previous_pipe_action{};
    };
#endif

    // Reaps the child so the test run leaves no zombies behind.
    [[nodiscard]] std::optional<int> wait_for_exit(const ProcessId pid)
    {
#if defined(_WIN32)
        HANDLE process = ::OpenProcess(SYNCHRONIZE | PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
        if (process == nullptr)
        {
            return std::nullopt;
        }

        std::optional<int> result;
        DWORD exit_code = 0;
        if (::WaitForSingleObject(process, 30'000) == WAIT_OBJECT_0 && ::GetExitCodeProcess(process, &exit_code) != FALSE)
        {
            result = static_cast<int>(exit_code);
        }
        ::CloseHandle(process);
        return result;
#else
        const auto status = wait_for_status(pid);
        if (!status || !WIFEXITED(*status))
        {
            return std::nullopt;
        }
        return WEXITSTATUS(*status);
#endif
    }

    [[nodiscard]] constexpr bool self_respawn_supported() noexcept
    {
        return current_host_platform() == HostPlatform::posix || current_host_platform() == HostPlatform::windows;
    }

    bool test_self_respawn_spawns_distinct_process()
    {
        if (!self_respawn_supported())
        {
            return true;
        }

        const ScopedEnvironmentVariable guard(rl::tests::spawned_child_env, std::string("1"));
        rl::logging::Logger logger(rl::logging::LogLevel::error);
        InstanceLauncher instance_launcher(logger);

        const LaunchOutcome outcome = instance_launcher.launch_new_instance();
        const auto* success = std::get_if<LaunchSuccess>(&outcome);
        if (success == nullptr)
        {
            return false;
        }

        const bool distinct = success->process_id != rl::core::current_process_id();
        const bool message_ok = success->message == "New process spawned with PID: " + std::to_string(success->process_id);
        const auto exit_code = wait_for_exit(success->process_id);
        return distinct && message_ok && exit_code == 0;
    }

    bool test_sequential_launches_are_independent()
    {
        if (!self_respawn_supported())
        {
            return true;
        }

        const ScopedEnvironmentVariable guard(rl::tests::spawned_child_env, std::string("1"));
        rl::logging::Logger logger(rl::logging::LogLevel::error);
        InstanceLauncher instance_launcher(logger);

        // Children are reaped only after all three launches so the OS cannot
        // hand out a recycled pid within the batch.
        std::set<ProcessId> pids;
        for (int i = 0; i < 3; ++i)
        {
            const auto result = instance_launcher.launch();
            if (!result)
            {
                return false;
            }
            pids.insert(*result);
        }

        bool all_exited = true;
        for (const ProcessId pid : pids)
        {
            all_exited = wait_for_exit(pid) == 0 && all_exited;
        }

        return pids.size() == 3 && !pids.contains(rl::core::current_process_id()) && all_exited;
    }

    [[nodiscard]] bool create_marker(const std::filesystem::path& path)
    {
        const rl::core::UniqueFile file(std::fopen(path.string().c_str(), "wb"));
        return file.valid();
    }

    [[nodiscard]] bool wait_for_file(const std::filesystem::path& path, const std::chrono::seconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            std::error_code error;
            if (std::filesystem::exists(path, error))
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return false;
    }

    // A spawned instance starts its own instance and ends abruptly. The
    // instance it started keeps running until released.
    bool test_spawned_instance_outlives_its_caller()
    {
        if (!self_respawn_supported())
        {
            return true;
        }

        std::error_code error;
        const std::filesystem::path directory = std::filesystem::temp_directory_path(error) /
            ("relaunch_outlive_" + std::to_string(rl::core::current_process_id()));
        if (error)
        {
            return false;
        }
        (void)std::filesystem::remove_all(directory, error);
        if (!std::filesystem::create_directories(directory, error))
        {
            return false;
        }

        bool caller_exited = false;
        bool spawned = false;
        bool still_running = false;
        {
            const ScopedEnvironmentVariable role(
                rl::tests::spawned_child_env,
                std::string(rl::tests::spawn_and_exit_role) + directory.string());
            rl::logging::Logger logger(rl::logging::LogLevel::error);
            InstanceLauncher instance_launcher(logger);

            const auto caller = instance_launcher.launch();
            if (caller)
            {
                caller_exited = wait_for_exit(*caller) == 0;
                spawned = std::filesystem::exists(directory / "spawned", error);
                still_running = !std::filesystem::exists(directory / "done", error);
            }
        }

        const bool released = create_marker(directory / "release");
        const bool finished = released && wait_for_file(directory / "done", std::chrono::seconds(30));

        // Give the released instance a moment to close its file before cleanup.
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        (void)std::filesystem::remove_all(directory, error);

        return caller_exited && spawned && still_running && finished;
    }

    bool test_spawn_of_missing_binary_reports_os_error()
    {
        const auto spawner = make_host_process_spawner();
        const LaunchCommand command{
#if defined(_WIN32)
            .program = "C:\\relaunch_missing_dir\\relaunch_missing.exe",
#else
            .program = "/relaunch_missing_dir/relaunch_missing",
#endif
            .arguments = {},
            .search_path = false,
            .new_console = false,
        };

        const auto result = spawner->spawn(command);
        if (result)
        {
            (void)wait_for_exit(*result);
            return false;
        }

        const std::string message = describe(result.error());
        return result.error().kind == LaunchErrorKind::process_creation &&
               !result.error().diagnostic.empty() &&
               message.starts_with("Failed to spawn new process: ") &&
               message.size() > std::string("Failed to spawn new process: ").size();
    }

    bool test_empty_program_is_rejected()
    {
        const auto spawner = make_host_process_spawner();
        const auto result = spawner->spawn(LaunchCommand{});
        return !result && result.error().os_error == std::make_error_code(std::errc::invalid_argument);
    }

#if !defined(_WIN32)
    bool test_search_path_spawn()
    {
        PosixProcessSpawner spawner;
        const LaunchCommand command{
            .program = "true",
            .arguments = {},
            .search_path = true,
            .new_console = false,
        };

        const auto result = spawner.spawn(command);
        return result && *result > 0 && wait_for_exit(*result) == 0;
    }

    bool test_arguments_are_passed()
    {
        PosixProcessSpawner spawner;
        const LaunchCommand command{
            .program = "/bin/sh",
            .arguments = { "-c", "exit 7" },
            .search_path = false,
            .new_console = false,
        };

        const auto result = spawner.spawn(command);
        return result && wait_for_exit(*result) == 7;
    }

    bool test_child_starts_with_default_signal_state()
    {
        const ScopedHostSignalState host_signals;
        PosixProcessSpawner spawner;

        const auto terminated_by = [&](const char* script) -> std::optional<int> {
            const LaunchCommand command{
                .program = "/bin/sh",
                .arguments = { "-c", script },
                .search_path = false,
                .new_console = false,
            };

            const auto result = spawner.spawn(command);
            if (!result)
            {
                return std::nullopt;
            }
            return wait_for_termination_signal(*result);
        };

        // A blocked SIGTERM or an ignored SIGPIPE would let the shell reach `exit 0`.
        return terminated_by("kill -TERM $$; exit 0") == SIGTERM &&
               terminated_by("kill -PIPE $$; exit 0") == SIGPIPE;
    }
#endif
}

bool run_process_integration_tests()
{
    return test_self_respawn_spawns_distinct_process() &&
           test_sequential_launches_are_independent() &&
           test_spawned_instance_outlives_its_caller() &&
           test_spawn_of_missing_binary_reports_os_error() &&
           test_empty_program_is_rejected()
#if !defined(_WIN32)
           && test_search_path_spawn() &&
           test_arguments_are_passed() &&
           test_child_starts_with_default_signal_state()
#endif
        ;
}
