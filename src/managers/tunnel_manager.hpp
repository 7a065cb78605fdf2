#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <ssh/connector.hpp>

// One live SSH-backed SOCKS5 forward.
struct TunnelInfo {
    int local_port = 0;
    std::string host;           // SSH server
    std::string username;
    int remote_port = 0;        // SSH port that won the race
    std::string proxy_type = "socks5";
    std::string external_ip;
    std::shared_ptr<SshLink> link;

    // "socks5://localhost:<local_port>"
    std::string address() const;
};

struct TunnelOptions {
    std::vector<int> candidate_ports;   // empty → port 22
    int connect_timeout = 20;
    int login_timeout = 15;
    std::string bind_address = "0.0.0.0";
};

// Establishes, verifies and tears down tunnels. Owns the registry of active
// forwards (one per local port) and the cache of the remote port that last
// worked for each (host, username, secret). Safe to share between workers.
class TunnelManager {
public:
    TunnelManager(SshConnector& connector, TunnelOptions options);
    ~TunnelManager();

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // Connect (racing every candidate remote port), serve SOCKS5 on
    // local_port (any free port if unset), confirm the proxy works by
    // resolving the external IP through it, then register. Any existing
    // tunnel on that local port is torn down first. Throws TunnelError.
    TunnelInfo establish(const std::string& host, const std::string& username,
                         const std::string& secret,
                         std::optional<int> local_port = std::nullopt);

    // establish() + teardown. Never throws; any failure reads as dead.
    bool verify_only(const std::string& host, const std::string& username,
                     const std::string& secret);

    // Remove and close the tunnel on local_port. Throws NotFoundError.
    void teardown_by_port(int local_port);

    // Like teardown_by_port, but only if the tunnel on local_port still goes
    // through host as username. Returns whether one was closed.
    bool teardown_if(int local_port, const std::string& host, const std::string& username);

    void teardown_all();

    bool is_alive(int local_port);

    // External IP through the tunnel on local_port, nullopt if not registered
    // or the round-trip fails.
    std::optional<std::string> probe_external_ip(int local_port);

    std::vector<int> active_ports() const;
    std::optional<TunnelInfo> find(int local_port) const;

    std::optional<int> cached_remote_port(const std::string& host, const std::string& username,
                                          const std::string& secret) const;

private:
    SshConnector& connector_;
    TunnelOptions options_;

    mutable std::mutex mutex_;
    std::map<int, TunnelInfo> tunnels_;
    std::map<std::string, int> remote_port_cache_;

    static std::string cache_key(const std::string& host, const std::string& username,
                                 const std::string& secret);

    std::vector<int> candidate_ports(const std::string& key) const;

    // Race one connection attempt per candidate port; the first success
    // cancels the rest. All attempts are joined before returning.
    std::unique_ptr<SshLink> connect_first(const SshTarget& base,
                                           const std::vector<int>& ports);
};
