#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static bool valid_port(long value) {
    return value > 0 && value <= 65535;
}

Result<std::vector<int>> parse_port_list(const std::string& text) {
    std::vector<int> ports;
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        std::string digits = text.substr(start, i - start);
        long value = digits.size() > 5 ? 0 : std::stol(digits);
        if (!valid_port(value)) {
            return Result<std::vector<int>>::Err(fmt::format("Invalid port '{}'", digits));
        }
        ports.push_back(static_cast<int>(value));
    }
    return Result<std::vector<int>>::Ok(ports);
}

Result<std::vector<int>> parse_port_numbers(const std::string& text) {
    std::vector<int> ports;
    std::stringstream ss(text);
    std::string item;

    auto to_port = [](std::string s, long& out) {
        s.erase(std::remove_if(s.begin(), s.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                s.end());
        if (s.empty() || s.size() > 5 ||
            !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        out = std::stol(s);
        return valid_port(out);
    };

    while (std::getline(ss, item, ',')) {
        if (item.find_first_not_of(" \t") == std::string::npos) continue;

        long first = 0, last = 0;
        auto dash = item.find('-');
        if (dash == std::string::npos) {
            if (!to_port(item, first)) {
                return Result<std::vector<int>>::Err(fmt::format("Invalid port '{}'", item));
            }
            last = first;
        } else {
            if (!to_port(item.substr(0, dash), first) || !to_port(item.substr(dash + 1), last)) {
                return Result<std::vector<int>>::Err(fmt::format("Invalid port range '{}'", item));
            }
            if (last < first) {
                return Result<std::vector<int>>::Err(fmt::format("Empty port range '{}'", item));
            }
        }

        for (long p = first; p <= last; ++p) {
            if (std::find(ports.begin(), ports.end(), p) == ports.end()) {
                ports.push_back(static_cast<int>(p));
            }
        }
    }
    return Result<std::vector<int>>::Ok(ports);
}

fs::path Config::get_default_dir() {
    return platform::home_dir() / ".sockspool";
}

fs::path Config::get_default_path() {
    return get_default_dir() / "config.yaml";
}

Config Config::defaults() {
    Config config;
    config.ssh_.candidate_ports = {DEFAULT_SSH_PORT};
    config.port_.numbers = parse_port_numbers(DEFAULT_PORT_NUMBERS).value;
    config.store_path_ = get_default_dir() / "store.yaml";
    return config;
}

std::vector<int> Config::ssh_ports_or_default() const {
    if (ssh_.candidate_ports.empty()) return {DEFAULT_SSH_PORT};
    return ssh_.candidate_ports;
}

// Scalars may be written as numbers or strings ("22" vs 22, "2222 22").
static std::string scalar_text(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsDefined() || node.IsNull()) return fallback;
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!joined.empty()) joined += ",";
            joined += item.as<std::string>();
        }
        return joined;
    }
    return node.as<std::string>(fallback);
}

static Result<void> parse_ssh_config(const YAML::Node& node, SshPoolConfig& ssh) {
    ssh.tasks_count = node["tasks_count"].as<int>(ssh.tasks_count);
    ssh.connection_timeout = node["connection_timeout"].as<int>(ssh.connection_timeout);
    ssh.login_timeout = node["login_timeout"].as<int>(ssh.login_timeout);

    auto ports = parse_port_list(scalar_text(node["ports"], DEFAULT_SSH_PORTS));
    if (ports.is_err()) return Result<void>::Err("ssh.ports: " + ports.error);
    ssh.candidate_ports = ports.value;

    if (ssh.tasks_count < 0) return Result<void>::Err("ssh.tasks_count must not be negative");
    if (ssh.connection_timeout <= 0 || ssh.login_timeout <= 0) {
        return Result<void>::Err("ssh timeouts must be positive");
    }
    return Result<void>::Ok();
}

static Result<void> parse_port_config(const YAML::Node& node, PortPoolConfig& port) {
    port.tasks_count = node["tasks_count"].as<int>(port.tasks_count);
    port.use_unique_ssh = node["use_unique_ssh"].as<bool>(port.use_unique_ssh);
    port.auto_reset_ports = node["auto_reset_ports"].as<bool>(port.auto_reset_ports);
    port.reset_interval = node["reset_interval"].as<int>(port.reset_interval);
    port.bind_address = node["bind_address"].as<std::string>(port.bind_address);

    auto numbers = parse_port_numbers(scalar_text(node["numbers"], DEFAULT_PORT_NUMBERS));
    if (numbers.is_err()) return Result<void>::Err("port.numbers: " + numbers.error);
    port.numbers = numbers.value;

    if (port.tasks_count < 0) return Result<void>::Err("port.tasks_count must not be negative");
    if (port.reset_interval <= 0) return Result<void>::Err("port.reset_interval must be positive");
    return Result<void>::Ok();
}

static IpCheckConfig parse_ip_check_config(const YAML::Node& node) {
    IpCheckConfig ip;
    ip.host = node["host"].as<std::string>(ip.host);
    ip.port = node["port"].as<int>(ip.port);
    ip.path = node["path"].as<std::string>(ip.path);
    ip.timeout = node["timeout"].as<int>(ip.timeout);
    return ip;
}

static SchedulerConfig parse_scheduler_config(const YAML::Node& node) {
    SchedulerConfig s;
    s.idle_sleep_ms = node["idle_sleep_ms"].as<int>(s.idle_sleep_ms);
    s.flush_interval = node["flush_interval"].as<int>(s.flush_interval);
    return s;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config = defaults();

        auto ssh = parse_ssh_config(root["ssh"] ? root["ssh"] : YAML::Node(), config.ssh_);
        if (ssh.is_err()) return Result<Config>::Err(ssh.error);

        auto port = parse_port_config(root["port"] ? root["port"] : YAML::Node(), config.port_);
        if (port.is_err()) return Result<Config>::Err(port.error);

        config.ip_check_ = parse_ip_check_config(root["ip_check"] ? root["ip_check"] : YAML::Node());
        config.scheduler_ = parse_scheduler_config(root["scheduler"] ? root["scheduler"] : YAML::Node());

        if (root["store"] && root["store"]["path"]) {
            std::string path = root["store"]["path"].as<std::string>();
            if (path.rfind("~/", 0) == 0) {
                config.store_path_ = platform::home_dir() / path.substr(2);
            } else {
                config.store_path_ = path;
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(defaults());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str());
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    if (!path.parent_path().empty()) fs::create_directories(path.parent_path());

    const char* default_config = R"(# sockspool configuration

ssh:
  tasks_count: 20              # workers checking SSH credentials live/dead
  connection_timeout: 20       # seconds to connect before marking dead
  login_timeout: 15            # seconds to authenticate
  ports: "22"                  # candidate remote SSH ports, e.g. "2222, 22"

port:
  tasks_count: 20              # workers managing proxy ports
  use_unique_ssh: true         # never reuse an SSH already used on a port
  auto_reset_ports: true       # rotate each port's SSH periodically
  reset_interval: 60           # seconds between rotations
  numbers: "10000-10009"       # proxy ports
  bind_address: "0.0.0.0"

ip_check:
  host: "api.ipify.org"
  port: 80
  path: "/"
  timeout: 10

scheduler:
  idle_sleep_ms: 1000
  flush_interval: 5

# store:
#   path: "~/.sockspool/store.yaml"
)";

    try {
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
