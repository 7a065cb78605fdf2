#pragma once

#include <string>
#include <map>
#include <vector>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>

namespace fs = std::filesystem;

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<void(BaseCLI&, const Args&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    // Load the config file once; prints the error and returns false if it
    // cannot be parsed.
    bool require_config();

    // Returns the process exit code.
    int execute_command(const std::string& command, const Args& args);
    void print_help() const;

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Public state
    fs::path config_path;
    bool verbose = false;
    std::optional<Config> config;
    int exit_code = 0;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;
};
