#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() : config_path(Config::get_default_path()) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto result = Config::load(config_path);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("Invalid config {}: {}",
                                             config_path.string(), result.error));
        exit_code = 1;
        return false;
    }
    config = result.value;
    return true;
}

int BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'sockspool --help' for available commands.");
        return 1;
    }

    exit_code = 0;
    try {
        it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        exit_code = 1;
    }
    return exit_code;
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << theme::color::BLUE
                  << fmt::format("    {:<34}", "sockspool " + name + (cmd.usage.empty() ? "" : " " + cmd.usage))
                  << theme::color::RESET
                  << theme::color::DIM
                  << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n" << theme::color::DIM
              << "    --config <path>                   Config file (default "
              << Config::get_default_path().string() << ")\n"
              << "    sockspool --version               Show version\n"
              << "    sockspool --help                  Show this help"
              << theme::color::RESET << "\n\n";
}
