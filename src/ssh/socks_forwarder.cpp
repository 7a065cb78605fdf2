#include "socks_forwarder.hpp"
#include "session.hpp"
#include "socks5.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/pool_log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <sys/socket.h>
#include <unistd.h>

SocksForwarder::SocksForwarder(SshSession& session)
    : session_(session), listen_fd_(SOCKSPOOL_INVALID_SOCKET), port_(0),
      running_(false), stop_(false) {}

SocksForwarder::~SocksForwarder() {
    stop();
}

// ── Start/Stop ────────────────────────────────────────────

void SocksForwarder::start(const std::string& bind_address, int port) {
    if (running_) stop();

    std::string error;
    listen_fd_ = platform::listen_tcp(bind_address, port, LISTEN_BACKLOG, error);
    if (listen_fd_ == SOCKSPOOL_INVALID_SOCKET) {
        throw TunnelError("OSError", fmt::format("Cannot listen on {}:{}: {}",
                                                 bind_address, port, error));
    }

    port_ = port;
    stop_ = false;
    running_ = true;
    accept_thread_ = std::thread(&SocksForwarder::accept_loop, this);
}

void SocksForwarder::stop() {
    stop_ = true;
    if (accept_thread_.joinable()) accept_thread_.join();

    std::list<std::unique_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& c : clients) {
        if (c->thread.joinable()) c->thread.join();
    }

    if (listen_fd_ != SOCKSPOOL_INVALID_SOCKET) {
        platform::close_socket(listen_fd_);
        listen_fd_ = SOCKSPOOL_INVALID_SOCKET;
    }
    running_ = false;
}

// ── Accept loop ───────────────────────────────────────────

void SocksForwarder::reap_finished() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void SocksForwarder::accept_loop() {
    while (!stop_.load()) {
        reap_finished();

        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(listen_fd_, POLLIN, 500);
        if (!(revents & POLLIN)) continue;

        socket_t client = accept(listen_fd_, nullptr, nullptr);
        if (client < 0) continue;
        if (!session_.is_active()) {
            platform::close_socket(client);
            continue;
        }

        auto entry = std::make_unique<Client>();
        Client* raw = entry.get();
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.push_back(std::move(entry));
        raw->thread = std::thread([this, raw, client] {
            serve_client(client);
            raw->done = true;
        });
    }
}

// ── Per-connection relay ──────────────────────────────────

// Forward data between a local TCP socket and a libssh2 direct-tcpip channel.
// Runs until either side closes or the forwarder stops.
static void forward_connection(SshSession& session, socket_t client_fd,
                               LIBSSH2_CHANNEL* ch, const std::atomic<bool>& stop_flag) {
    char buf[RELAY_BUF_SIZE];
    auto mtx = session.io_mutex();

    while (!stop_flag.load() && session.is_active()) {
        // Wake on either side: local client or the SSH socket
        struct pollfd pfds[2] = {
            {client_fd, POLLIN, 0},
            {session.raw_socket(), POLLIN, 0},
        };
        int pr = poll(pfds, 2, SSH_POLL_INTERVAL_MS * 5);
        if (pr < 0) break;

        // local → channel
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(client_fd, buf, sizeof(buf));
            if (n <= 0) break;  // client closed

            ssize_t sent = 0;
            while (sent < n && !stop_flag.load()) {
                ssize_t w;
                {
                    std::lock_guard<std::mutex> lock(*mtx);
                    w = libssh2_channel_write(ch, buf + sent, static_cast<size_t>(n - sent));
                }
                if (w == LIBSSH2_ERROR_EAGAIN) {
                    platform::sleep_ms(1);
                    continue;
                }
                if (w < 0) goto done;
                sent += w;
            }
        }

        // channel → local, drain whatever is buffered
        for (;;) {
            ssize_t n;
            bool eof;
            {
                std::lock_guard<std::mutex> lock(*mtx);
                n = libssh2_channel_read(ch, buf, sizeof(buf));
                eof = libssh2_channel_eof(ch) != 0;
            }
            if (n > 0) {
                if (!platform::send_all(client_fd, buf, static_cast<size_t>(n),
                                        SOCKS_HANDSHAKE_TIMEOUT_MS)) {
                    goto done;
                }
                continue;
            }
            if (n == LIBSSH2_ERROR_EAGAIN && !eof) break;
            goto done;  // remote closed or channel error
        }
    }

done:
    {
        std::lock_guard<std::mutex> lock(*mtx);
        libssh2_channel_close(ch);
        libssh2_channel_free(ch);
    }
}

void SocksForwarder::serve_client(socket_t client_fd) {
    auto read_exact = [client_fd](uint8_t* buf, size_t n) {
        return platform::recv_exact(client_fd, reinterpret_cast<char*>(buf), n,
                                    SOCKS_HANDSHAKE_TIMEOUT_MS);
    };
    auto send_bytes = [client_fd](const std::vector<uint8_t>& bytes) {
        return platform::send_all(client_fd, reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size(), SOCKS_HANDSHAKE_TIMEOUT_MS);
    };

    auto greeting = socks5::read_greeting(read_exact);
    if (greeting.is_err()) {
        platform::close_socket(client_fd);
        return;
    }
    if (!greeting.value) {
        send_bytes(socks5::encode_method_selection(socks5::METHOD_NONE_ACCEPTABLE));
        platform::close_socket(client_fd);
        return;
    }
    if (!send_bytes(socks5::encode_method_selection(socks5::METHOD_NO_AUTH))) {
        platform::close_socket(client_fd);
        return;
    }

    socks5::Reply reply;
    auto request = socks5::read_request(read_exact, reply);
    if (request.is_err()) {
        if (reply != socks5::Reply::GeneralFailure) send_bytes(socks5::encode_reply(reply));
        platform::close_socket(client_fd);
        return;
    }

    LIBSSH2_CHANNEL* ch = session_.open_direct_tcpip(request.value.host, request.value.port, stop_);
    if (!ch) {
        pool_log(fmt::format("SocksForwarder :{}: direct-tcpip to {}:{} failed",
                             port_, request.value.host, request.value.port));
        send_bytes(socks5::encode_reply(socks5::Reply::HostUnreachable));
        platform::close_socket(client_fd);
        return;
    }

    if (send_bytes(socks5::encode_reply(socks5::Reply::Succeeded))) {
        forward_connection(session_, client_fd, ch, stop_);
    } else {
        std::lock_guard<std::mutex> lock(*session_.io_mutex());
        libssh2_channel_close(ch);
        libssh2_channel_free(ch);
    }
    platform::close_socket(client_fd);
}
