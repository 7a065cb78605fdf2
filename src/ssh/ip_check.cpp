#include "ip_check.hpp"
#include "socks5.hpp"
#include <core/constants.hpp>
#include <core/pool_log.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>

std::optional<std::string> parse_ip_response(const std::string& http_response) {
    size_t header_end = http_response.find("\r\n\r\n");
    size_t body_start = header_end == std::string::npos ? std::string::npos : header_end + 4;
    if (body_start == std::string::npos) {
        header_end = http_response.find("\n\n");
        if (header_end == std::string::npos) return std::nullopt;
        body_start = header_end + 2;
    }

    // Status line: "HTTP/1.x 200 OK"
    size_t line_end = http_response.find('\n');
    std::string status_line = http_response.substr(0, line_end);
    if (status_line.compare(0, 5, "HTTP/") != 0) return std::nullopt;
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || safe_stoi(status_line.substr(sp + 1, 3), 0) != 200) {
        return std::nullopt;
    }

    std::string body = http_response.substr(body_start);
    trim(body);
    if (!is_ip_literal(body)) return std::nullopt;
    return body;
}

std::optional<std::string> fetch_external_ip(const std::string& proxy_host, int proxy_port,
                                             const IpCheckConfig& config) {
    const int timeout_ms = config.timeout * 1000;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.timeout);

    std::string error;
    socket_t sock = platform::connect_tcp(proxy_host, proxy_port, timeout_ms, error);
    if (sock == SOCKSPOOL_INVALID_SOCKET) {
        pool_log(fmt::format("IP check :{}: {}", proxy_port, error));
        return std::nullopt;
    }

    auto read_exact = [sock, timeout_ms](uint8_t* buf, size_t n) {
        return platform::recv_exact(sock, reinterpret_cast<char*>(buf), n, timeout_ms);
    };
    auto send_bytes = [sock, timeout_ms](const std::string& bytes) {
        return platform::send_all(sock, bytes.data(), bytes.size(), timeout_ms);
    };
    auto fail = [&](const std::string& why) -> std::optional<std::string> {
        pool_log(fmt::format("IP check :{}: {}", proxy_port, why));
        platform::close_socket(sock);
        return std::nullopt;
    };

    // SOCKS5 handshake
    auto greeting = socks5::encode_greeting();
    if (!send_bytes(std::string(greeting.begin(), greeting.end()))) return fail("greeting not sent");
    uint8_t selection[2];
    if (!read_exact(selection, 2)) return fail("no method selection");
    if (selection[0] != socks5::VERSION || selection[1] != socks5::METHOD_NO_AUTH) {
        return fail("proxy refused no-auth");
    }

    auto connect = socks5::encode_connect(config.host, config.port);
    if (!send_bytes(std::string(connect.begin(), connect.end()))) return fail("request not sent");
    auto reply = socks5::read_reply(read_exact);
    if (reply.is_err()) return fail(reply.error);
    if (reply.value != socks5::Reply::Succeeded) {
        return fail(fmt::format("CONNECT {}:{} refused ({})", config.host, config.port,
                                static_cast<int>(reply.value)));
    }

    // HTTP/1.0 so the server closes after the body
    std::string request = fmt::format(
        "GET {} HTTP/1.0\r\nHost: {}\r\nUser-Agent: sockspool\r\nAccept: */*\r\n\r\n",
        config.path, config.host);
    if (!send_bytes(request)) return fail("HTTP request not sent");

    std::string response;
    char buf[1024];
    while (response.size() < static_cast<size_t>(IP_CHECK_MAX_RESPONSE)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return fail("HTTP response timed out");

        int revents = platform::poll_socket(sock, POLLIN, static_cast<int>(remaining));
        if (revents == 0) continue;
        ssize_t n = recv(sock, buf, sizeof(buf), 0);
        if (n > 0) {
            response.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        break;  // closed
    }
    platform::close_socket(sock);

    auto ip = parse_ip_response(response);
    if (!ip) pool_log(fmt::format("IP check :{}: unexpected response", proxy_port));
    return ip;
}
