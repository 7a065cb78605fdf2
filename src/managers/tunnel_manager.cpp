#include "tunnel_manager.hpp"
#include <core/errors.hpp>
#include <core/pool_log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>

std::string TunnelInfo::address() const {
    return fmt::format("{}://localhost:{}", proxy_type, local_port);
}

TunnelManager::TunnelManager(SshConnector& connector, TunnelOptions options)
    : connector_(connector), options_(std::move(options)) {}

TunnelManager::~TunnelManager() {
    teardown_all();
}

std::string TunnelManager::cache_key(const std::string& host, const std::string& username,
                                     const std::string& secret) {
    return host + "|" + username + "|" + secret;
}

std::vector<int> TunnelManager::candidate_ports(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = remote_port_cache_.find(key);
        if (it != remote_port_cache_.end()) return {it->second};
    }
    if (!options_.candidate_ports.empty()) return options_.candidate_ports;
    return {22};
}

// ── Connection race ───────────────────────────────────────

std::unique_ptr<SshLink> TunnelManager::connect_first(const SshTarget& base,
                                                      const std::vector<int>& ports) {
    std::atomic<bool> cancel{false};
    std::mutex race_mutex;
    std::unique_ptr<SshLink> winner;
    std::vector<TunnelError> errors;

    auto attempt = [&](int port) {
        SshTarget target = base;
        target.port = port;
        try {
            auto link = connector_.open(target, cancel);
            std::lock_guard<std::mutex> lock(race_mutex);
            if (!winner) {
                winner = std::move(link);
                cancel = true;
            } else {
                link->close();
            }
        } catch (const TunnelError& e) {
            std::lock_guard<std::mutex> lock(race_mutex);
            errors.push_back(e);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(race_mutex);
            errors.emplace_back("OSError", e.what());
        }
    };

    std::vector<std::thread> attempts;
    attempts.reserve(ports.size());
    try {
        for (int port : ports) attempts.emplace_back(attempt, port);
    } catch (const std::system_error& e) {
        // Started attempts reference this frame; cancel and join them
        cancel = true;
        for (auto& t : attempts) t.join();
        if (winner) winner->close();
        throw TunnelError("OSError", fmt::format("Cannot start connection attempt: {}", e.what()));
    }
    for (auto& t : attempts) t.join();

    if (winner) return winner;

    if (errors.size() == 1) throw errors.front();

    // Fold every failure into one error; keep the cause if they all agree
    std::string cause = errors.empty() ? "OSError" : errors.front().cause();
    std::string message;
    for (const auto& e : errors) {
        if (e.cause() != cause) cause = "MultipleErrors";
        if (!message.empty()) message += "; ";
        message += e.what();
    }
    if (message.empty()) message = "No candidate ports";
    throw TunnelError(cause, message);
}

// ── Establish ─────────────────────────────────────────────

TunnelInfo TunnelManager::establish(const std::string& host, const std::string& username,
                                    const std::string& secret, std::optional<int> local_port) {
    int port = local_port ? *local_port : platform::free_local_port();
    if (port <= 0) throw TunnelError("OSError", "No free local port");

    // A fresh ephemeral port has no tunnel of ours, and may be another
    // caller's by now
    if (local_port) {
        try {
            teardown_by_port(port);
        } catch (const NotFoundError&) {
        }
    }

    auto start = std::chrono::steady_clock::now();
    const std::string ssh_info = fmt::format("{:15} | {:5}", host, port);
    auto run_time = [&] {
        std::chrono::duration<double> d = std::chrono::steady_clock::now() - start;
        return fmt::format("{:4.1f}", d.count());
    };

    TunnelInfo info;
    info.local_port = port;
    info.host = host;
    info.username = username;

    try {
        const std::string key = cache_key(host, username, secret);

        SshTarget target;
        target.host = host;
        target.username = username;
        target.password = secret;
        target.connect_timeout = options_.connect_timeout;
        target.login_timeout = options_.login_timeout;

        std::shared_ptr<SshLink> link = connect_first(target, candidate_ports(key));
        info.remote_port = link->remote_port();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remote_port_cache_[key] = info.remote_port;
        }

        try {
            link->forward_socks(options_.bind_address, port);
        } catch (const TunnelError&) {
            link->close();
            throw;
        } catch (const std::exception& e) {
            link->close();
            throw TunnelError("OSError", fmt::format("Cannot serve SOCKS5 on port {}: {}", port, e.what()));
        }

        auto ip = connector_.probe_external_ip(port);
        if (!ip) {
            link->close();
            throw TunnelError("ProxyError", "Cannot connect to forwarded proxy.");
        }
        info.external_ip = *ip;
        info.link = std::move(link);
    } catch (const TunnelError& e) {
        pool_log(fmt::format("{} ({}s) - {}", ssh_info, run_time(), e.what()));
        throw;
    }

    pool_log(fmt::format("{} ({}s) - Connected successfully.", ssh_info, run_time()));

    // Another worker may have bound the same port meanwhile; last one wins
    std::shared_ptr<SshLink> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(port);
        if (it != tunnels_.end()) replaced = it->second.link;
        tunnels_[port] = info;
    }
    if (replaced && replaced != info.link) replaced->close();
    return info;
}

bool TunnelManager::verify_only(const std::string& host, const std::string& username,
                                const std::string& secret) {
    try {
        TunnelInfo info = establish(host, username, secret);
        try {
            teardown_by_port(info.local_port);
        } catch (const NotFoundError&) {
            info.link->close();
        }
        return true;
    } catch (const TunnelError&) {
        return false;
    } catch (const std::exception& e) {
        pool_log(fmt::format("{:15} | verify failed: {}", host, e.what()));
        return false;
    }
}

// ── Teardown ──────────────────────────────────────────────

void TunnelManager::teardown_by_port(int local_port) {
    std::shared_ptr<SshLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(local_port);
        if (it == tunnels_.end()) {
            throw NotFoundError(fmt::format("No proxy on port {} found.", local_port));
        }
        link = it->second.link;
        tunnels_.erase(it);
    }
    // Closing joins relay threads; keep it outside the registry lock
    if (link) link->close();
}

bool TunnelManager::teardown_if(int local_port, const std::string& host,
                                const std::string& username) {
    std::shared_ptr<SshLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(local_port);
        if (it == tunnels_.end()) return false;
        if (it->second.host != host || it->second.username != username) return false;
        link = it->second.link;
        tunnels_.erase(it);
    }
    if (link) link->close();
    return true;
}

void TunnelManager::teardown_all() {
    std::map<int, TunnelInfo> tunnels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tunnels.swap(tunnels_);
    }
    for (auto& [port, info] : tunnels) {
        if (info.link) info.link->close();
    }
}

// ── Queries ───────────────────────────────────────────────

bool TunnelManager::is_alive(int local_port) {
    std::shared_ptr<SshLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(local_port);
        if (it == tunnels_.end()) return false;
        link = it->second.link;
    }
    return link && link->is_alive();
}

std::optional<std::string> TunnelManager::probe_external_ip(int local_port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tunnels_.find(local_port) == tunnels_.end()) return std::nullopt;
    }
    return connector_.probe_external_ip(local_port);
}

std::vector<int> TunnelManager::active_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> ports;
    ports.reserve(tunnels_.size());
    for (const auto& [port, info] : tunnels_) ports.push_back(port);
    return ports;
}

std::optional<TunnelInfo> TunnelManager::find(int local_port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tunnels_.find(local_port);
    if (it == tunnels_.end()) return std::nullopt;
    return it->second;
}

std::optional<int> TunnelManager::cached_remote_port(const std::string& host,
                                                     const std::string& username,
                                                     const std::string& secret) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = remote_port_cache_.find(cache_key(host, username, secret));
    if (it == remote_port_cache_.end()) return std::nullopt;
    return it->second;
}
