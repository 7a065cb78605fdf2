#pragma once

#include <memory>
#include "connector.hpp"
#include "session.hpp"
#include "socks_forwarder.hpp"
#include <core/types.hpp>

// SshLink over a libssh2 session, serving SOCKS5 through SocksForwarder.
class Libssh2Link : public SshLink {
public:
    explicit Libssh2Link(std::unique_ptr<SshSession> session);
    ~Libssh2Link() override;

    int remote_port() const override;
    void forward_socks(const std::string& bind_address, int local_port) override;
    bool is_alive() override;
    void close() override;

private:
    std::unique_ptr<SshSession> session_;
    std::unique_ptr<SocksForwarder> forwarder_;
};

class Libssh2Connector : public SshConnector {
public:
    explicit Libssh2Connector(IpCheckConfig ip_check);

    std::unique_ptr<SshLink> open(const SshTarget& target,
                                  const std::atomic<bool>& cancel) override;
    std::optional<std::string> probe_external_ip(int local_port) override;

private:
    IpCheckConfig ip_check_;
};
