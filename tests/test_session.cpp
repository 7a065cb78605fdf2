#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include <core/errors.hpp>
#include <platform/socket_util.hpp>
#include <sys/socket.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

// A peer that sends an SSH banner and then never answers key exchange.
class SilentSshPeer {
public:
    SilentSshPeer() {
        std::string error;
        port_ = platform::free_local_port();
        listen_fd_ = platform::listen_tcp("127.0.0.1", port_, 4, error);
        if (listen_fd_ == SOCKSPOOL_INVALID_SOCKET) return;
        thread_ = std::thread([this] { serve(); });
    }

    ~SilentSshPeer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        if (listen_fd_ != SOCKSPOOL_INVALID_SOCKET) platform::close_socket(listen_fd_);
    }

    bool listening() const { return listen_fd_ != SOCKSPOOL_INVALID_SOCKET; }
    int port() const { return port_; }

private:
    int port_ = 0;
    socket_t listen_fd_ = SOCKSPOOL_INVALID_SOCKET;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void serve() {
        socket_t client = SOCKSPOOL_INVALID_SOCKET;
        while (!stop_ && client == SOCKSPOOL_INVALID_SOCKET) {
            if (platform::poll_socket(listen_fd_, POLLIN, 50) & POLLIN) {
                client = accept(listen_fd_, nullptr, nullptr);
            }
        }
        if (client == SOCKSPOOL_INVALID_SOCKET) return;

        const std::string banner = "SSH-2.0-Silent\r\n";
        platform::send_all(client, banner.data(), banner.size(), 1000);
        while (!stop_) std::this_thread::sleep_for(std::chrono::milliseconds(20));
        platform::close_socket(client);
    }
};

TEST(SshSession, StalledHandshakeFailsAndClosesPromptly) {
    SilentSshPeer peer;
    ASSERT_TRUE(peer.listening());

    SshTarget target;
    target.host = "127.0.0.1";
    target.port = peer.port();
    target.username = "root";
    target.password = "secret";
    target.connect_timeout = 1;
    target.login_timeout = 1;

    SshSession session(target);
    std::atomic<bool> cancel{false};
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(session.connect(cancel), TunnelError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Handshake budget plus the bounded disconnect flush
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(session.is_active());
    EXPECT_EQ(session.raw_session(), nullptr);
    EXPECT_EQ(session.raw_socket(), SOCKSPOOL_INVALID_SOCKET);

    session.close();
    EXPECT_FALSE(session.is_active());
}
