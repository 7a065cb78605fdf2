#include "socket_util.hpp"
#include "platform.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <chrono>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error, const std::atomic<bool>* cancel) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host " + host + ": " + gai_strerror(gai);
        return SOCKSPOOL_INVALID_SOCKET;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    socket_t sock = SOCKSPOOL_INVALID_SOCKET;
    error = "No address for " + host;

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            error = "Failed to create socket: " + std::string(strerror(errno));
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            error = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = SOCKSPOOL_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect in short slices so cancel is honored
        bool connected = (ret == 0);
        while (!connected) {
            if (cancel && cancel->load()) {
                error = "Cancelled";
                break;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                error = "Connection timed out: " + host + ":" + service;
                break;
            }
            int revents = poll_socket(sock, POLLOUT, static_cast<int>(std::min<long long>(left, 100)));
            if (revents == 0) continue;

            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                error = "Connection failed: " + std::string(strerror(sock_err));
                break;
            }
            connected = true;
        }

        if (connected) {
            freeaddrinfo(res);
            error.clear();
            return sock;
        }
        close_socket(sock);
        sock = SOCKSPOOL_INVALID_SOCKET;
        if (cancel && cancel->load()) break;
    }

    freeaddrinfo(res);
    return SOCKSPOOL_INVALID_SOCKET;
}

socket_t listen_tcp(const std::string& address, int port, int backlog, std::string& error) {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "socket() failed: " + std::string(strerror(errno));
        return SOCKSPOOL_INVALID_SOCKET;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid bind address " + address;
        close_socket(fd);
        return SOCKSPOOL_INVALID_SOCKET;
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind() failed for port " + std::to_string(port) + ": " + strerror(errno);
        close_socket(fd);
        return SOCKSPOOL_INVALID_SOCKET;
    }

    if (listen(fd, backlog) < 0) {
        error = "listen() failed for port " + std::to_string(port) + ": " + strerror(errno);
        close_socket(fd);
        return SOCKSPOOL_INVALID_SOCKET;
    }
    return fd;
}

int free_local_port() {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    int port = -1;
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    close_socket(fd);
    return port;
}

std::string local_ipv4_address() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) return "127.0.0.1";

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(hostname, nullptr, &hints, &res) != 0 || !res) return "127.0.0.1";

    char buf[INET_ADDRSTRLEN] = {};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(res);
    return buf;
}

bool send_all(socket_t sock, const char* data, size_t len, int timeout_ms) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
        if (w > 0) {
            sent += static_cast<size_t>(w);
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (poll_socket(sock, POLLOUT, timeout_ms) == 0) return false;
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

bool recv_exact(socket_t sock, char* data, size_t len, int timeout_ms) {
    size_t got = 0;
    while (got < len) {
        int revents = poll_socket(sock, POLLIN, timeout_ms);
        if (revents == 0) return false;
        ssize_t n = recv(sock, data + got, len - got, 0);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        return false;
    }
    return true;
}

} // namespace platform
