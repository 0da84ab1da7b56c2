#include "app/application.hpp"

#include "core/console_writer.hpp"

#include <exception>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    try
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }

        rl::app::Application application;
        return application.run(args);
    }
    catch (const std::exception& error)
    {
        rl::core::write_console_line(std::string("Unhandled exception: ") + error.what());
        return 70;
    }
    catch (...)
    {
        rl::core::write_console_line("Unhandled unknown exception");
        return 70;
    }
}
