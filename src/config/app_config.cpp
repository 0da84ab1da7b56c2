#include "config/app_config.hpp"

#include "core/environment.hpp"
#include "core/unique_resource.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <new>
#include <optional>

namespace rl::config
{
    namespace
    {
        constexpr long kMaxConfigBytes = 2 * 1024 * 1024;

        [[nodiscard]] std::string trim(std::string value)
        {
            auto not_space = [](const char ch) {
                return ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n';
            };

            auto begin_it = std::find_if(value.begin(), value.end(), not_space);
            if (begin_it == value.end())
            {
                return {};
            }

            auto end_it = std::find_if(value.rbegin(), value.rend(), not_space).base();
            return std::string(begin_it, end_it);
        }

        [[nodiscard]] rl::logging::LogLevel parse_log_level(const std::string_view text)
        {
            if (text == "trace")
            {
                return rl::logging::LogLevel::trace;
            }
            if (text == "debug")
            {
                return rl::logging::LogLevel::debug;
            }
            if (text == "warning")
            {
                return rl::logging::LogLevel::warning;
            }
            if (text == "error")
            {
                return rl::logging::LogLevel::error;
            }
            return rl::logging::LogLevel::info;
        }

        [[nodiscard]] bool parse_bool(const std::string_view text)
        {
            return text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON";
        }

        [[nodiscard]] std::expected<std::string, ConfigError> read_config_file(const std::string& path) noexcept
        {
            core::UniqueFile file(std::fopen(path.c_str(), "rb"));
            if (!file.valid())
            {
                return std::unexpected(ConfigError{
                    .message = "fopen failed for config path",
                    .os_error = std::error_code(errno, std::generic_category()),
                });
            }

            if (std::fseek(file.get(), 0, SEEK_END) != 0)
            {
                return std::unexpected(ConfigError{
                    .message = "fseek failed for config path",
                    .os_error = std::error_code(errno, std::generic_category()),
                });
            }

            const long file_size = std::ftell(file.get());
            if (file_size < 0 || file_size > kMaxConfigBytes)
            {
                return std::unexpected(ConfigError{
                    .message = "Config file size is invalid",
                    .os_error = std::make_error_code(std::errc::file_too_large),
                });
            }
            std::rewind(file.get());

            try
            {
                std::string bytes(static_cast<size_t>(file_size), '\0');
                if (!bytes.empty() && std::fread(bytes.data(), 1, bytes.size(), file.get()) != bytes.size())
                {
                    return std::unexpected(ConfigError{
                        .message = "fread failed for config path",
                        .os_error = std::make_error_code(std::errc::io_error),
                    });
                }

                // Tolerate a UTF-8 BOM written by editors.
                if (bytes.size() >= 3 &&
                    static_cast<unsigned char>(bytes[0]) == 0xEF &&
                    static_cast<unsigned char>(bytes[1]) == 0xBB &&
                    static_cast<unsigned char>(bytes[2]) == 0xBF)
                {
                    bytes.erase(0, 3);
                }
                return bytes;
            }
            catch (const std::bad_alloc&)
            {
                return std::unexpected(ConfigError{
                    .message = "Out of memory reading config path",
                    .os_error = std::make_error_code(std::errc::not_enough_memory),
                });
            }
        }

        void apply_key_value(AppConfig& config, std::string key, std::string value)
        {
            key = trim(std::move(key));
            value = trim(std::move(value));

            if (key == "log_level")
            {
                config.minimum_log_level = parse_log_level(value);
                return;
            }
            if (key == "stderr_sink")
            {
                config.enable_stderr_sink = parse_bool(value);
                return;
            }
            if (key == "file_logging")
            {
                config.enable_file_logging = parse_bool(value);
                return;
            }
            if (key == "log_directory")
            {
                config.log_directory_path = std::move(value);
                return;
            }
            if (key == "dry_run")
            {
                config.dry_run = parse_bool(value);
            }
        }

        void apply_environment_overrides(AppConfig& config)
        {
            if (const auto value = core::read_environment(ConfigLoader::log_level_env))
            {
                config.minimum_log_level = parse_log_level(*value);
            }
            if (const auto value = core::read_environment(ConfigLoader::stderr_sink_env))
            {
                config.enable_stderr_sink = parse_bool(*value);
            }
            if (const auto value = core::read_environment(ConfigLoader::file_logging_env))
            {
                config.enable_file_logging = parse_bool(*value);
            }
            if (const auto value = core::read_environment(ConfigLoader::log_directory_env))
            {
                config.log_directory_path = *value;
            }
            if (const auto value = core::read_environment(ConfigLoader::dry_run_env))
            {
                config.dry_run = parse_bool(*value);
            }
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::load() noexcept
    {
        try
        {
            AppConfig config{};

            if (const auto config_path = core::read_environment(config_path_env); config_path && !config_path->empty())
            {
                auto file_text = read_config_file(*config_path);
                if (!file_text)
                {
                    return std::unexpected(file_text.error());
                }

                auto parsed = parse_text(file_text.value());
                if (!parsed)
                {
                    return std::unexpected(parsed.error());
                }
                config = std::move(parsed.value());
            }

            apply_environment_overrides(config);
            return config;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{
                .message = "Out of memory loading configuration",
                .os_error = std::make_error_code(std::errc::not_enough_memory),
            });
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::parse_text(const std::string_view text) noexcept
    {
        try
        {
            AppConfig config{};
            size_t begin = 0;
            size_t line_number = 1;

            while (begin < text.size())
            {
                size_t end = text.find('\n', begin);
                if (end == std::string_view::npos)
                {
                    end = text.size();
                }

                std::string line = trim(std::string(text.substr(begin, end - begin)));
                if (!line.empty() && !line.starts_with("#") && !line.starts_with(";"))
                {
                    const size_t equals_index = line.find('=');
                    if (equals_index == std::string::npos)
                    {
                        return std::unexpected(ConfigError{
                            .message = "Invalid config line " + std::to_string(line_number) + " (missing '=')",
                            .os_error = std::make_error_code(std::errc::invalid_argument),
                        });
                    }

                    apply_key_value(config, line.substr(0, equals_index), line.substr(equals_index + 1));
                }

                begin = end + 1;
                ++line_number;
            }

            return config;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{
                .message = "Out of memory parsing configuration",
                .os_error = std::make_error_code(std::errc::not_enough_memory),
            });
        }
    }
}
