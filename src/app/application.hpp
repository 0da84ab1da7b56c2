#pragma once

#include <span>
#include <string>

namespace rl::app
{
    enum class ExitCode : int
    {
        success = 0,
        launch_failed = 1,
        invalid_arguments = 2,
        bad_configuration = 3,
    };

    class Application final
    {
    public:
        // `args` excludes argv[0].
        [[nodiscard]] int run(std::span<const std::string> args);
    };
}
