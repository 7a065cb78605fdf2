#include <iostream>
#include <vector>
#include <string>
#include "cli/pool_cli.hpp"
#include "cli/theme.hpp"

static const char* VERSION = "0.1.0";

void print_usage(const SockspoolCLI& cli) {
    std::cout << theme::banner();
    cli.print_help();
}

int main(int argc, char** argv) {
    try {
        SockspoolCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "sockspool"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_usage(cli);
            return 0;
        } else if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage(cli);
            return 1;
        }

        std::vector<std::string> rest(argv + 2, argv + argc);
        return cli.run(cmd, rest);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
