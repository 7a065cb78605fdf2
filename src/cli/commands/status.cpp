#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <chrono>
#include <map>
#include <set>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/assignment.hpp>
#include <managers/entity_store.hpp>
#include <platform/socket_util.hpp>

static void do_status(BaseCLI& cli, const BaseCLI::Args& args) {
    if (!cli.require_config()) return;
    const Config& config = cli.config.value();

    EntityStore store(config.store_path());
    store.load();

    std::map<EntityId, Credential> creds;
    int live = 0;
    int assigned = 0;
    for (auto& c : store.credentials()) {
        if (c.is_live) live++;
        if (c.port) assigned++;
        creds[c.id] = c;
    }

    const std::string lan_ip = platform::local_ipv4_address();
    const auto now = Clock::now();
    const auto max_age = std::chrono::seconds(config.port().reset_interval);

    std::set<EntityId> due_ids;
    for (const auto& p : find_ports_due_for_rotation(store, max_age, now)) due_ids.insert(p.id);

    std::cout << theme::section("Ports");
    std::cout << theme::color::DIM
              << fmt::format("    {:<30} {:<16} {:<16} {:<8} {:<8} {}\n",
                             "PROXY", "SSH", "IP", "UP", "CHECKED", "ROTATE")
              << theme::color::RESET;

    for (const auto& port : store.ports()) {
        std::string proxy = fmt::format("socks5://{}:{}", lan_ip, port.port_number);
        std::string host = "-";
        if (port.credential) {
            auto it = creds.find(*port.credential);
            host = it != creds.end() ? it->second.host : "?";
        }
        std::string up = port.time_connected ? format_duration(to_iso(*port.time_connected)) : "-";
        std::string checked = port.check.last_checked
                                  ? format_timestamp(to_iso(*port.check.last_checked)) : "-";
        bool due = config.port().auto_reset_ports && due_ids.count(port.id) > 0;

        std::string row = fmt::format("    {:<30} {:<16} {:<16} {:<8} {:<8} {}",
                                      proxy, host,
                                      port.external_ip.empty() ? "-" : port.external_ip,
                                      up, checked, due ? "due" : "");
        std::cout << (port.credential ? row : theme::dim(row)) << "\n";
    }

    std::cout << theme::section("Credentials");
    std::cout << theme::kv("Live", std::to_string(live));
    std::cout << theme::kv("Assigned", std::to_string(assigned));
    std::cout << theme::kv("Total", std::to_string(creds.size()));
    std::cout << "\n";
}

void register_status_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "", "Show ports, their SSH and external IP");
}
