#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load config from the given file. A missing file yields defaults.
    static Result<Config> load(const fs::path& path = get_default_path());

    // Parse a YAML document (used by load() and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults, no file involved.
    static Config defaults();

    static fs::path get_default_dir();
    static fs::path get_default_path();

    // Accessors
    const SshPoolConfig& ssh() const { return ssh_; }
    const PortPoolConfig& port() const { return port_; }
    const IpCheckConfig& ip_check() const { return ip_check_; }
    const SchedulerConfig& scheduler() const { return scheduler_; }
    const fs::path& store_path() const { return store_path_; }

    // Candidate remote SSH ports, never empty (falls back to 22).
    std::vector<int> ssh_ports_or_default() const;

    Config() = default;

private:
    SshPoolConfig ssh_;
    PortPoolConfig port_;
    IpCheckConfig ip_check_;
    SchedulerConfig scheduler_;
    fs::path store_path_;
};

// Every run of digits in `text` is a port: "2222, 22" → {2222, 22}.
Result<std::vector<int>> parse_port_list(const std::string& text);

// Comma list of ports and inclusive ranges: "10000-10002,10010" →
// {10000, 10001, 10002, 10010}. Duplicates are dropped, order kept.
Result<std::vector<int>> parse_port_numbers(const std::string& text);

// Write the default config file unless one already exists.
Result<void> create_default_config(const fs::path& path = Config::get_default_path());
