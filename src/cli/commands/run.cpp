#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <atomic>
#include <csignal>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/pool_log.hpp>
#include <core/utils.hpp>
#include <managers/assignment.hpp>
#include <managers/entity_store.hpp>
#include <managers/pool_scheduler.hpp>
#include <managers/tunnel_manager.hpp>
#include <platform/platform.hpp>
#include <ssh/libssh2_connector.hpp>

static std::atomic<bool> g_stop_requested{false};

static void on_stop_signal(int) {
    g_stop_requested = true;
}

static void install_stop_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // Clients hanging up mid-relay must not kill the process
    signal(SIGPIPE, SIG_IGN);
}

static TunnelOptions tunnel_options(const Config& config) {
    TunnelOptions opts;
    opts.candidate_ports = config.ssh_ports_or_default();
    opts.connect_timeout = config.ssh().connection_timeout;
    opts.login_timeout = config.ssh().login_timeout;
    opts.bind_address = config.port().bind_address;
    return opts;
}

static void do_run(BaseCLI& cli, const BaseCLI::Args& args) {
    if (!cli.require_config()) return;
    const Config& config = cli.config.value();

    EntityStore store(config.store_path());
    store.load();

    Libssh2Connector connector(config.ip_check());
    TunnelManager tunnels(connector, tunnel_options(config));
    PoolScheduler scheduler(store, tunnels, config);

    install_stop_handlers();
    scheduler.start();

    auto creds = store.credentials();
    std::cout << theme::section("sockspool");
    std::cout << theme::kv("Store", config.store_path().string());
    std::cout << theme::kv("Creds", std::to_string(creds.size()));
    std::cout << theme::kv("Ports", std::to_string(config.port().numbers.size()));
    std::cout << theme::kv("Log", pool_log_path());
    std::cout << theme::step("Running. Ctrl-C to stop.");
    if (creds.empty()) {
        std::cout << theme::info("No credentials in the store; add them while stopped.");
    }

    while (!g_stop_requested.load()) {
        platform::sleep_ms(SHUTDOWN_POLL_MS);
    }

    std::cout << theme::dim("    Stopping...") << "\n";
    scheduler.stop();
    std::cout << theme::ok("Stopped, store saved.");
}

static void do_reset(BaseCLI& cli, const BaseCLI::Args& args) {
    if (!cli.require_config()) return;
    const Config& config = cli.config.value();

    EntityStore store(config.store_path());
    store.load();

    if (args.empty()) {
        reset_all(store);
        store.save();
        std::cout << theme::ok(fmt::format("Reset {} ports and {} credentials.",
                                           store.ports().size(), store.credentials().size()));
        return;
    }

    int number = safe_stoi(args[0], -1);
    for (const auto& port : store.ports()) {
        if (port.port_number != number) continue;
        reset_port(store, port.id);
        store.save();
        std::cout << theme::ok(fmt::format("Reset port {}.", number));
        return;
    }
    std::cout << theme::fail(fmt::format("No proxy on port {} found.", args[0]));
    cli.exit_code = 1;
}

void register_run_commands(BaseCLI& cli) {
    cli.add_command("run", do_run, "[-v]", "Run both worker pools until signalled");
    cli.add_command("reset", do_reset, "[port]", "Clear assignments and check state");
}
