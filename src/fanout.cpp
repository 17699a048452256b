#include <exception>
#include <string>
#include <vector>
#include "fanout/driver/command.hpp"
#include "fanout/driver/console.hpp"
#include "fanout/driver/handlers.hpp"

using namespace fanout::driver;

int main(int argc, char* argv[])
{
    auto console = console_t{};
    auto parsed = parse_args(std::vector<std::string>(argv + 1, argv + argc));

    if (!parsed.invocation) {
        console.error("error: " + parsed.error);
        print_usage(console);
        return 2;
    }

    try {
        run(*parsed.invocation, console);
    } catch (const std::exception& e) {
        console.error(std::string("error: ") + e.what());
        return 1;
    }
    return 0;
}
