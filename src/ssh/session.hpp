#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "connector.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One libssh2 session over one TCP socket, always in non-blocking mode.
// Every libssh2 call on the session must hold io_mutex().
class SshSession {
public:
    explicit SshSession(const SshTarget& target);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // TCP connect, handshake, authenticate. Throws TunnelError.
    void connect(const std::atomic<bool>& cancel);
    void close();

    bool is_active() const;
    bool check_alive();

    // Open a direct-tcpip channel to host:port (as seen from the server).
    // nullptr on failure or after CHANNEL_OPEN_TIMEOUT_SECS.
    LIBSSH2_CHANNEL* open_direct_tcpip(const std::string& host, int port,
                                       const std::atomic<bool>& stop);

    LIBSSH2_SESSION* raw_session() { return session_; }
    socket_t raw_socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }
    const SshTarget& target() const { return target_; }

private:
    SshTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::atomic<bool> active_;
    std::shared_ptr<std::mutex> io_mutex_;

    void apply_method_prefs();
    void userauth(std::chrono::steady_clock::time_point deadline,
                  const std::atomic<bool>& cancel);
    void wait_socket(int timeout_ms);
};
