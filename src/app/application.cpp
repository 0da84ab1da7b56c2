#include "app/application.hpp"

#include "cli/launch_arguments.hpp"
#include "config/app_config.hpp"
#include "core/console_writer.hpp"
#include "core/environment.hpp"
#include "launcher/instance_launcher.hpp"
#include "logging/logger.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <string>
#include <system_error>

// `app/application.cpp` is the caller layer of the instance launcher.
//
// Startup order: config -> logging -> CLI parse -> action. The only
// action with side effects is `--new-instance`; everything it prints comes
// from the launcher's outcome messages.

namespace rl::app
{
    namespace
    {
        [[nodiscard]] constexpr int to_int(const ExitCode code) noexcept
        {
            return static_cast<int>(code);
        }

        void configure_sinks(logging::Logger& logger, const config::AppConfig& config)
        {
            if (config.enable_stderr_sink)
            {
                logger.add_sink(std::make_shared<logging::StderrLogSink>());
            }
            if (!config.enable_file_logging)
            {
                return;
            }

            const std::expected<std::string, std::error_code> resolved_path = config.log_directory_path.empty()
                ? logging::FileLogSink::resolve_default_log_path()
                : logging::FileLogSink::resolve_log_path(config.log_directory_path);
            if (!resolved_path)
            {
                logger.log(
                    logging::LogLevel::warning,
                    "File logging disabled; path resolution failed: {}",
                    resolved_path.error().message());
                return;
            }

            auto file_sink = logging::FileLogSink::create(resolved_path.value());
            if (!file_sink)
            {
                logger.log(logging::LogLevel::warning, "File logging disabled; open failed: {}", file_sink.error().message());
                return;
            }

            logger.add_sink(file_sink.value());
            logger.log(logging::LogLevel::info, "File logging enabled at {}", resolved_path.value());
        }

        [[nodiscard]] int run_dry(launcher::InstanceLauncher& instance_launcher, logging::Logger& logger)
        {
            const auto command = instance_launcher.plan();
            if (!command)
            {
                const std::string message = launcher::describe(command.error());
                logger.log(logging::LogLevel::error, "Dry run failed: {}", message);
                core::write_output_line(message);
                return to_int(ExitCode::launch_failed);
            }

            core::write_output_line(std::format("Dry run: {}", launcher::format_command(*command)));
            return to_int(ExitCode::success);
        }

        [[nodiscard]] int run_launches(launcher::InstanceLauncher& instance_launcher, const std::uint32_t count)
        {
            bool all_succeeded = true;
            for (std::uint32_t attempt = 0; attempt < count; ++attempt)
            {
                const launcher::LaunchOutcome outcome = instance_launcher.launch_new_instance();
                core::write_output_line(launcher::outcome_message(outcome));
                all_succeeded = all_succeeded && launcher::succeeded(outcome);
            }

            return to_int(all_succeeded ? ExitCode::success : ExitCode::launch_failed);
        }
    }

    int Application::run(const std::span<const std::string> args)
    {
        auto config_result = config::ConfigLoader::load();
        if (!config_result)
        {
            std::string message = "Configuration error: " + config_result.error().message;
            if (config_result.error().os_error)
            {
                message.append(" (");
                message.append(config_result.error().os_error.message());
                message.push_back(')');
            }
            core::write_console_line(message);
            return to_int(ExitCode::bad_configuration);
        }

        const config::AppConfig config = std::move(config_result.value());

        logging::Logger logger(config.minimum_log_level);
        configure_sinks(logger, config);
        logger.log(logging::LogLevel::debug, "Startup context: pid={}, arguments={}", core::current_process_id(), args.size());

        auto parsed_args = cli::LaunchArguments::parse(args);
        if (!parsed_args)
        {
            logger.log(logging::LogLevel::error, "Parse error: {}", parsed_args.error().message);
            core::write_console_line("Invalid arguments: " + parsed_args.error().message);
            core::write_console_line(cli::LaunchArguments::usage());
            return to_int(ExitCode::invalid_arguments);
        }

        const cli::LaunchArguments arguments = std::move(parsed_args.value());
        if (arguments.help_requested())
        {
            core::write_output_line(cli::LaunchArguments::usage());
            return to_int(ExitCode::success);
        }

        launcher::InstanceLauncher instance_launcher(logger);

        if (arguments.dry_run() || config.dry_run)
        {
            return run_dry(instance_launcher, logger);
        }

        if (arguments.new_instance_requested())
        {
            return run_launches(instance_launcher, arguments.count());
        }

        core::write_output_line(std::format("Instance running with PID: {}", core::current_process_id()));
        return to_int(ExitCode::success);
    }
}
