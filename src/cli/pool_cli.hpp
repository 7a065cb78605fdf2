#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_run_commands(BaseCLI& cli);
void register_status_commands(BaseCLI& cli);
void register_check_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class SockspoolCLI : public BaseCLI {
public:
    SockspoolCLI();

    // Parse global flags (-v, --config) out of argv[2..] and dispatch.
    int run(const std::string& command, const std::vector<std::string>& argv_rest);
};
