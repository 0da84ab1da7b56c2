#include "app/application.hpp"
#include "config/app_config.hpp"
#include "scoped_environment.hpp"

#include <optional>
#include <string>
#include <vector>

namespace
{
    using rl::app::Application;
    using rl::app::ExitCode;
    using rl::config::ConfigLoader;
    using rl::tests::ScopedEnvironmentVariable;

    // Quiet, file-less configuration for every application run.
    class QuietEnvironment final
    {
    public:
        QuietEnvironment() :
            _config(std::string(ConfigLoader::config_path_env), std::nullopt),
            _stderr_sink(std::string(ConfigLoader::stderr_sink_env), std::string("0")),
            _file_logging(std::string(ConfigLoader::file_logging_env), std::string("0")),
            _dry_run(std::string(ConfigLoader::dry_run_env), std::nullopt)
        {
        }

    private:
        ScopedEnvironmentVariable _config;
        ScopedEnvironmentVariable _stderr_sink;
        ScopedEnvironmentVariable _file_logging;
        ScopedEnvironmentVariable _dry_run;
    };

    [[nodiscard]] int run(const std::vector<std::string>& args)
    {
        Application application;
        return application.run(args);
    }

    bool test_plain_instance_succeeds()
    {
        const QuietEnvironment quiet;
        return run({}) == static_cast<int>(ExitCode::success);
    }

    bool test_help_succeeds()
    {
        const QuietEnvironment quiet;
        return run({ "--help" }) == static_cast<int>(ExitCode::success);
    }

    bool test_invalid_arguments_exit_code()
    {
        const QuietEnvironment quiet;
        return run({ "--bogus" }) == static_cast<int>(ExitCode::invalid_arguments) &&
               run({ "--count", "2" }) == static_cast<int>(ExitCode::invalid_arguments);
    }

    bool test_bad_configuration_exit_code()
    {
        const QuietEnvironment quiet;
        const ScopedEnvironmentVariable config(
            std::string(ConfigLoader::config_path_env),
            std::string("relaunch_missing_application_config.conf"));
        return run({}) == static_cast<int>(ExitCode::bad_configuration);
    }

    bool test_dry_run_does_not_spawn()
    {
        const QuietEnvironment quiet;
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
        const auto expected_code = ExitCode::success;
#else
        const auto expected_code = ExitCode::launch_failed;
#endif
        // Without the spawned-child guard a real launch would re-run this
        // test binary; dry run must therefore never reach the spawner.
        return run({ "--new-instance", "--dry-run" }) == static_cast<int>(expected_code);
    }

    bool test_dry_run_from_configuration()
    {
        const QuietEnvironment quiet;
        const ScopedEnvironmentVariable dry_run(std::string(ConfigLoader::dry_run_env), std::string("true"));
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
        return run({ "--new-instance" }) == static_cast<int>(ExitCode::success);
#else
        return run({ "--new-instance" }) == static_cast<int>(ExitCode::launch_failed);
#endif
    }
}

bool run_application_tests()
{
    return test_plain_instance_succeeds() &&
           test_help_succeeds() &&
           test_invalid_arguments_exit_code() &&
           test_bad_configuration_exit_code() &&
           test_dry_run_does_not_spawn() &&
           test_dry_run_from_configuration();
}
