#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

// Where and how to open one SSH transport.
struct SshTarget {
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    int connect_timeout = 20;   // seconds, TCP connect + handshake
    int login_timeout = 15;     // seconds, authentication
};

// One authenticated SSH transport. Failures throw TunnelError.
class SshLink {
public:
    virtual ~SshLink() = default;

    // Remote SSH port this link connected to.
    virtual int remote_port() const = 0;

    // Serve SOCKS5 on bind_address:local_port, tunneled through this link.
    virtual void forward_socks(const std::string& bind_address, int local_port) = 0;

    virtual bool is_alive() = 0;

    // Idempotent.
    virtual void close() = 0;
};

// Network primitives the tunnel manager is built on.
class SshConnector {
public:
    virtual ~SshConnector() = default;

    // Connect + authenticate. Must return promptly (throwing TunnelError with
    // cause "Cancelled") once `cancel` becomes true.
    virtual std::unique_ptr<SshLink> open(const SshTarget& target,
                                          const std::atomic<bool>& cancel) = 0;

    // Apparent external IP seen through the SOCKS5 proxy on local_port.
    virtual std::optional<std::string> probe_external_ip(int local_port) = 0;
};
