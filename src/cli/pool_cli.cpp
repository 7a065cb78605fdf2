#include "pool_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <core/pool_log.hpp>

SockspoolCLI::SockspoolCLI() : BaseCLI() {
    register_run_commands(*this);
    register_status_commands(*this);
    register_check_commands(*this);
    register_setup_commands(*this);
}

int SockspoolCLI::run(const std::string& command, const std::vector<std::string>& argv_rest) {
    Args args;
    for (size_t i = 0; i < argv_rest.size(); i++) {
        const std::string& a = argv_rest[i];
        if (a == "-v" || a == "--verbose") {
            verbose = true;
        } else if (a == "--config") {
            if (i + 1 >= argv_rest.size()) {
                std::cout << theme::fail("--config needs a path");
                return 1;
            }
            config_path = argv_rest[++i];
        } else {
            args.push_back(a);
        }
    }

    set_pool_log_echo(verbose);
    return execute_command(command, args);
}
