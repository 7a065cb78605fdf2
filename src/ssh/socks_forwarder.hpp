#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <platform/socket_util.hpp>

class SshSession;

// Local SOCKS5 server whose CONNECTs are carried by direct-tcpip channels
// of one SSH session.
class SocksForwarder {
public:
    explicit SocksForwarder(SshSession& session);
    ~SocksForwarder();

    SocksForwarder(const SocksForwarder&) = delete;
    SocksForwarder& operator=(const SocksForwarder&) = delete;

    // Bind and start accepting. Throws TunnelError("OSError", ...) if the
    // port cannot be bound.
    void start(const std::string& bind_address, int port);

    // Stop accepting, close every relayed connection and join all threads.
    void stop();

    bool is_running() const { return running_; }
    int port() const { return port_; }

private:
    struct Client {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    SshSession& session_;
    socket_t listen_fd_;
    int port_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_;
    std::thread accept_thread_;
    std::mutex clients_mutex_;
    std::list<std::unique_ptr<Client>> clients_;

    void accept_loop();
    void reap_finished();
    void serve_client(socket_t client_fd);
};
