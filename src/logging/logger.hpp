#pragma once

#include "core/unique_resource.hpp"
#include "logging/log_level.hpp"

#include <atomic>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace rl::logging
{
    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;
        virtual void write(std::string_view line) noexcept = 0;
    };

    class StderrLogSink final : public ILogSink
    {
    public:
        void write(std::string_view line) noexcept override;
    };

    class FileLogSink final : public ILogSink
    {
    public:
        [[nodiscard]] static std::expected<std::shared_ptr<FileLogSink>, std::error_code> create(const std::string& path) noexcept;
        [[nodiscard]] static std::expected<std::string, std::error_code> resolve_log_path(std::string directory_path) noexcept;
        [[nodiscard]] static std::expected<std::string, std::error_code> resolve_default_log_path() noexcept;
        void write(std::string_view line) noexcept override;

    private:
        explicit FileLogSink(core::UniqueFile file) noexcept;

        std::mutex _lock;
        core::UniqueFile _file;
    };

    class Logger final
    {
    public:
        explicit Logger(LogLevel minimum_level);

        void add_sink(std::shared_ptr<ILogSink> sink);
        void set_minimum_level(LogLevel level) noexcept;
        [[nodiscard]] LogLevel minimum_level() const noexcept;

        template<typename... Args>
        void log(const LogLevel level, const std::format_string<Args...> format_text, Args&&... args)
        {
            if (level < _minimum_level.load(std::memory_order_relaxed))
            {
                return;
            }

            const std::string body = std::format(format_text, std::forward<Args>(args)...);
            log_preformatted(level, body);
        }

        void log_preformatted(LogLevel level, std::string_view body);

    private:
        static std::string_view level_to_string(LogLevel level) noexcept;
        static std::string build_timestamped_line(LogLevel level, std::string_view body);

        std::atomic<LogLevel> _minimum_level;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };
}
