#include "socks5.hpp"
#include <arpa/inet.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

namespace socks5 {

Result<bool> read_greeting(const ReadExact& read) {
    uint8_t head[2];
    if (!read(head, 2)) return Result<bool>::Err("Short greeting");
    if (head[0] != VERSION) {
        return Result<bool>::Err(fmt::format("Unsupported SOCKS version {}", head[0]));
    }

    std::vector<uint8_t> methods(head[1]);
    if (!methods.empty() && !read(methods.data(), methods.size())) {
        return Result<bool>::Err("Short method list");
    }
    bool no_auth = std::find(methods.begin(), methods.end(), METHOD_NO_AUTH) != methods.end();
    return Result<bool>::Ok(no_auth);
}

std::vector<uint8_t> encode_method_selection(uint8_t method) {
    return {VERSION, method};
}

Result<Request> read_request(const ReadExact& read, Reply& reply) {
    reply = Reply::GeneralFailure;

    uint8_t head[4];
    if (!read(head, 4)) return Result<Request>::Err("Short request");
    if (head[0] != VERSION) {
        return Result<Request>::Err(fmt::format("Unsupported SOCKS version {}", head[0]));
    }

    Request req;
    req.command = head[1];

    switch (head[3]) {
    case ATYP_IPV4: {
        uint8_t addr[4];
        if (!read(addr, 4)) return Result<Request>::Err("Short IPv4 address");
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, addr, buf, sizeof(buf));
        req.host = buf;
        break;
    }
    case ATYP_IPV6: {
        uint8_t addr[16];
        if (!read(addr, 16)) return Result<Request>::Err("Short IPv6 address");
        char buf[INET6_ADDRSTRLEN] = {};
        inet_ntop(AF_INET6, addr, buf, sizeof(buf));
        req.host = buf;
        break;
    }
    case ATYP_DOMAIN: {
        uint8_t len = 0;
        if (!read(&len, 1)) return Result<Request>::Err("Short domain length");
        if (len == 0) return Result<Request>::Err("Empty domain name");
        std::string name(len, '\0');
        if (!read(reinterpret_cast<uint8_t*>(&name[0]), len)) {
            return Result<Request>::Err("Short domain name");
        }
        req.host = name;
        break;
    }
    default:
        reply = Reply::AddressTypeNotSupported;
        return Result<Request>::Err(fmt::format("Unsupported address type {}", head[3]));
    }

    uint8_t port[2];
    if (!read(port, 2)) return Result<Request>::Err("Short port");
    req.port = (port[0] << 8) | port[1];

    if (req.command != CMD_CONNECT) {
        reply = Reply::CommandNotSupported;
        return Result<Request>::Err(fmt::format("Unsupported command {}", req.command));
    }

    reply = Reply::Succeeded;
    return Result<Request>::Ok(req);
}

std::vector<uint8_t> encode_reply(Reply code) {
    return {VERSION, static_cast<uint8_t>(code), 0x00, ATYP_IPV4, 0, 0, 0, 0, 0, 0};
}

std::vector<uint8_t> encode_greeting() {
    return {VERSION, 0x01, METHOD_NO_AUTH};
}

std::vector<uint8_t> encode_connect(const std::string& host, int port) {
    std::vector<uint8_t> out = {VERSION, CMD_CONNECT, 0x00};

    uint8_t addr[16];
    if (inet_pton(AF_INET, host.c_str(), addr) == 1) {
        out.push_back(ATYP_IPV4);
        out.insert(out.end(), addr, addr + 4);
    } else if (inet_pton(AF_INET6, host.c_str(), addr) == 1) {
        out.push_back(ATYP_IPV6);
        out.insert(out.end(), addr, addr + 16);
    } else {
        size_t len = std::min<size_t>(host.size(), 255);
        out.push_back(ATYP_DOMAIN);
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), host.begin(), host.begin() + static_cast<long>(len));
    }

    out.push_back(static_cast<uint8_t>((port >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(port & 0xFF));
    return out;
}

Result<Reply> read_reply(const ReadExact& read) {
    uint8_t head[4];
    if (!read(head, 4)) return Result<Reply>::Err("Short reply");
    if (head[0] != VERSION) {
        return Result<Reply>::Err(fmt::format("Unsupported SOCKS version {}", head[0]));
    }

    size_t addr_len = 0;
    switch (head[3]) {
    case ATYP_IPV4: addr_len = 4; break;
    case ATYP_IPV6: addr_len = 16; break;
    case ATYP_DOMAIN: {
        uint8_t len = 0;
        if (!read(&len, 1)) return Result<Reply>::Err("Short bound address");
        addr_len = len;
        break;
    }
    default:
        return Result<Reply>::Err(fmt::format("Unsupported address type {}", head[3]));
    }

    std::vector<uint8_t> rest(addr_len + 2);
    if (!read(rest.data(), rest.size())) return Result<Reply>::Err("Short bound address");
    return Result<Reply>::Ok(static_cast<Reply>(head[1]));
}

} // namespace socks5
