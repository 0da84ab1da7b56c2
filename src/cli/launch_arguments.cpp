#include "cli/launch_arguments.hpp"

#include "serialization/fast_number.hpp"

#include <new>

namespace rl::cli
{
    std::expected<LaunchArguments, ParseError> LaunchArguments::parse(const std::span<const std::string> args) noexcept
    {
        try
        {
            LaunchArguments parsed;
            for (size_t index = 0; index < args.size(); ++index)
            {
                const std::string_view arg = args[index];

                if (arg == new_instance_arg)
                {
                    parsed._new_instance = true;
                    continue;
                }

                if (arg == dry_run_arg)
                {
                    parsed._dry_run = true;
                    continue;
                }

                if (arg == help_arg || arg == help_short_arg)
                {
                    parsed._help = true;
                    continue;
                }

                if (arg == count_arg)
                {
                    if (index + 1 >= args.size())
                    {
                        return std::unexpected(ParseError{ .message = "Expected value after --count" });
                    }

                    ++index;
                    const auto value = serialization::parse_u32(args[index]);
                    if (!value || *value == 0 || *value > max_count)
                    {
                        return std::unexpected(ParseError{
                            .message = "--count must be between 1 and " + std::to_string(max_count),
                        });
                    }

                    parsed._count = *value;
                    parsed._count_given = true;
                    continue;
                }

                return std::unexpected(ParseError{ .message = "Unknown argument: " + std::string(arg) });
            }

            if (parsed._count_given && !parsed._new_instance)
            {
                return std::unexpected(ParseError{ .message = "--count requires --new-instance" });
            }

            return parsed;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ParseError{ .message = "out of memory" });
        }
    }

    std::string LaunchArguments::usage()
    {
        return "Usage: relaunch [--new-instance [--count <n>]] [--dry-run] [--help]\n"
               "  --new-instance  start an independent copy of this program\n"
               "  --count <n>     number of copies to start (1-64, default 1)\n"
               "  --dry-run       print the launch command without starting anything\n"
               "  --help, -h      show this text";
    }

    bool LaunchArguments::new_instance_requested() const noexcept
    {
        return _new_instance;
    }

    std::uint32_t LaunchArguments::count() const noexcept
    {
        return _count;
    }

    bool LaunchArguments::dry_run() const noexcept
    {
        return _dry_run;
    }

    bool LaunchArguments::help_requested() const noexcept
    {
        return _help;
    }
}
