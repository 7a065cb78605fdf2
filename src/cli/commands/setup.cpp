#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/config.hpp>

static void do_init(BaseCLI& cli, const BaseCLI::Args& args) {
    bool existed = fs::exists(cli.config_path);
    auto result = create_default_config(cli.config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        cli.exit_code = 1;
        return;
    }
    if (existed) {
        std::cout << theme::info("Config already exists: " + cli.config_path.string());
    } else {
        std::cout << theme::ok("Wrote " + cli.config_path.string());
    }
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "", "Write the default config file");
}
