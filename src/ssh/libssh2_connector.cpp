#include "libssh2_connector.hpp"
#include "ip_check.hpp"

// ── Libssh2Link ───────────────────────────────────────────

Libssh2Link::Libssh2Link(std::unique_ptr<SshSession> session)
    : session_(std::move(session)) {}

Libssh2Link::~Libssh2Link() {
    close();
}

int Libssh2Link::remote_port() const {
    return session_->target().port;
}

void Libssh2Link::forward_socks(const std::string& bind_address, int local_port) {
    if (forwarder_) forwarder_->stop();
    forwarder_ = std::make_unique<SocksForwarder>(*session_);
    forwarder_->start(bind_address, local_port);
}

bool Libssh2Link::is_alive() {
    if (forwarder_ && !forwarder_->is_running()) return false;
    return session_->check_alive();
}

void Libssh2Link::close() {
    // Relay threads use the session; stop them before it goes away
    if (forwarder_) {
        forwarder_->stop();
        forwarder_.reset();
    }
    session_->close();
}

// ── Libssh2Connector ──────────────────────────────────────

Libssh2Connector::Libssh2Connector(IpCheckConfig ip_check)
    : ip_check_(std::move(ip_check)) {}

std::unique_ptr<SshLink> Libssh2Connector::open(const SshTarget& target,
                                                const std::atomic<bool>& cancel) {
    auto session = std::make_unique<SshSession>(target);
    session->connect(cancel);
    return std::make_unique<Libssh2Link>(std::move(session));
}

std::optional<std::string> Libssh2Connector::probe_external_ip(int local_port) {
    return fetch_external_ip("127.0.0.1", local_port, ip_check_);
}
