#include "logging/logger.hpp"

#include "core/assert.hpp"
#include "core/environment.hpp"

#include <chrono>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <new>
#include <optional>

namespace rl::logging
{
    namespace
    {
        [[nodiscard]] std::string append_path_component(std::string base, const std::string_view component)
        {
            if (!base.empty())
            {
                const char tail = base.back();
                if (tail != '\\' && tail != '/')
                {
#ifdef _WIN32
                    base.push_back('\\');
#else
                    base.push_back('/');
#endif
                }
            }

            base.append(component);
            return base;
        }

        [[nodiscard]] std::expected<void, std::error_code> ensure_directory_exists(const std::string& path) noexcept
        {
            std::error_code error;
            const std::filesystem::path directory(path);
            if (std::filesystem::is_directory(directory, error))
            {
                return {};
            }

            if (std::filesystem::exists(directory, error))
            {
                return std::unexpected(std::make_error_code(std::errc::not_a_directory));
            }

            if (!std::filesystem::create_directories(directory, error) && error)
            {
                return std::unexpected(error);
            }

            return {};
        }

        [[nodiscard]] std::tm local_time(const std::time_t seconds) noexcept
        {
            std::tm result{};
#ifdef _WIN32
            (void)::localtime_s(&result, &seconds);
#else
            (void)::localtime_r(&seconds, &result);
#endif
            return result;
        }
    }

    void StderrLogSink::write(const std::string_view line) noexcept
    {
        (void)std::fwrite(line.data(), 1, line.size(), stderr);
        (void)std::fputc('\n', stderr);
    }

    FileLogSink::FileLogSink(core::UniqueFile file) noexcept :
        _file(std::move(file))
    {
    }

    std::expected<std::shared_ptr<FileLogSink>, std::error_code> FileLogSink::create(const std::string& path) noexcept
    {
        core::UniqueFile file(std::fopen(path.c_str(), "ab"));
        if (!file.valid())
        {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }

        try
        {
            return std::shared_ptr<FileLogSink>(new FileLogSink(std::move(file)));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
        }
    }

    std::expected<std::string, std::error_code> FileLogSink::resolve_log_path(std::string directory_path) noexcept
    {
        if (directory_path.empty())
        {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        if (auto ensured = ensure_directory_exists(directory_path); !ensured)
        {
            return std::unexpected(ensured.error());
        }

        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch());

        try
        {
            std::string file_name = std::format("relaunch_{}_{}.log", core::current_process_id(), now.count());
            return append_path_component(std::move(directory_path), file_name);
        }
        catch (const std::exception&)
        {
            return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
        }
    }

    std::expected<std::string, std::error_code> FileLogSink::resolve_default_log_path() noexcept
    {
        std::string log_directory;
        try
        {
            std::optional<std::string> temp_root = core::read_environment("TMPDIR");
            if (!temp_root || temp_root->empty())
            {
                temp_root = core::read_environment("TEMP");
            }
            if (!temp_root || temp_root->empty())
            {
                temp_root = core::read_environment("TMP");
            }
#ifndef _WIN32
            if (!temp_root || temp_root->empty())
            {
                temp_root = std::string("/tmp");
            }
#endif
            if (!temp_root || temp_root->empty())
            {
                return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
            }

            log_directory = append_path_component(*temp_root, "relaunch");
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
        }

        return resolve_log_path(std::move(log_directory));
    }

    void FileLogSink::write(const std::string_view line) noexcept
    {
        std::lock_guard guard(_lock);
        if (!_file.valid())
        {
            return;
        }

        (void)std::fwrite(line.data(), 1, line.size(), _file.get());
        (void)std::fputc('\n', _file.get());
        (void)std::fflush(_file.get());
    }

    Logger::Logger(const LogLevel minimum_level) :
        _minimum_level(minimum_level)
    {
    }

    void Logger::add_sink(std::shared_ptr<ILogSink> sink)
    {
        RL_ASSERT(sink != nullptr);
        _sinks.push_back(std::move(sink));
    }

    void Logger::set_minimum_level(const LogLevel level) noexcept
    {
        _minimum_level.store(level, std::memory_order_relaxed);
    }

    LogLevel Logger::minimum_level() const noexcept
    {
        return _minimum_level.load(std::memory_order_relaxed);
    }

    void Logger::log_preformatted(const LogLevel level, const std::string_view body)
    {
        if (level < _minimum_level.load(std::memory_order_relaxed))
        {
            return;
        }

        const std::string line = build_timestamped_line(level, body);
        for (const auto& sink : _sinks)
        {
            sink->write(line);
        }
    }

    std::string_view Logger::level_to_string(const LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::trace:
            return "TRACE";
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warning:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }

    std::string Logger::build_timestamped_line(const LogLevel level, const std::string_view body)
    {
        const auto now = std::chrono::system_clock::now();
        const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        const std::tm calendar = local_time(std::chrono::system_clock::to_time_t(now));

        return std::format(
            "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] {}",
            calendar.tm_year + 1900,
            calendar.tm_mon + 1,
            calendar.tm_mday,
            calendar.tm_hour,
            calendar.tm_min,
            calendar.tm_sec,
            milliseconds,
            level_to_string(level),
            body);
    }
}
