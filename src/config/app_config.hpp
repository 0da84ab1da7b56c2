#pragma once

#include "logging/log_level.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace rl::config
{
    struct ConfigError final
    {
        std::string message;
        std::error_code os_error;
    };

    struct AppConfig final
    {
        rl::logging::LogLevel minimum_log_level{ rl::logging::LogLevel::info };
        bool dry_run{ false };
        bool enable_stderr_sink{ true };
        bool enable_file_logging{ false };
        std::string log_directory_path;
    };

    class ConfigLoader final
    {
    public:
        static constexpr std::string_view config_path_env = "RELAUNCH_CONFIG";
        static constexpr std::string_view log_level_env = "RELAUNCH_LOG_LEVEL";
        static constexpr std::string_view stderr_sink_env = "RELAUNCH_STDERR_SINK";
        static constexpr std::string_view file_logging_env = "RELAUNCH_FILE_LOGGING";
        static constexpr std::string_view log_directory_env = "RELAUNCH_LOG_DIR";
        static constexpr std::string_view dry_run_env = "RELAUNCH_DRY_RUN";

        // File named by RELAUNCH_CONFIG first, then environment overrides.
        [[nodiscard]] static std::expected<AppConfig, ConfigError> load() noexcept;
        [[nodiscard]] static std::expected<AppConfig, ConfigError> parse_text(std::string_view text) noexcept;
    };
}
