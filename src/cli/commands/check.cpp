#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <managers/tunnel_manager.hpp>
#include <ssh/libssh2_connector.hpp>

static void do_check(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 3) {
        std::cout << theme::fail("Missing arguments.");
        std::cout << theme::step("Usage: sockspool check <host> <user> <password>");
        cli.exit_code = 1;
        return;
    }
    if (!cli.require_config()) return;
    const Config& config = cli.config.value();

    TunnelOptions opts;
    opts.candidate_ports = config.ssh_ports_or_default();
    opts.connect_timeout = config.ssh().connection_timeout;
    opts.login_timeout = config.ssh().login_timeout;
    opts.bind_address = "127.0.0.1";

    Libssh2Connector connector(config.ip_check());
    TunnelManager tunnels(connector, opts);

    std::cout << theme::step(fmt::format("Connecting to {} as {}...", args[0], args[1]));
    try {
        TunnelInfo info = tunnels.establish(args[0], args[1], args[2]);
        std::cout << theme::ok("Live");
        std::cout << theme::kv("SSH port", std::to_string(info.remote_port));
        std::cout << theme::kv("IP", info.external_ip);
        tunnels.teardown_by_port(info.local_port);
    } catch (const TunnelError& e) {
        std::cout << theme::fail(fmt::format("Dead ({})", e.what()));
        cli.exit_code = 1;
    }
}

void register_check_commands(BaseCLI& cli) {
    cli.add_command("check", do_check, "<host> <user> <password>",
                    "Try one SSH credential once");
}
