#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>

// SOCKS5 (RFC 1928) wire helpers: the server side used by SocksForwarder and
// the client side used by the external-IP check.
namespace socks5 {

constexpr uint8_t VERSION                = 0x05;
constexpr uint8_t METHOD_NO_AUTH         = 0x00;
constexpr uint8_t METHOD_NONE_ACCEPTABLE = 0xFF;
constexpr uint8_t CMD_CONNECT            = 0x01;
constexpr uint8_t ATYP_IPV4              = 0x01;
constexpr uint8_t ATYP_DOMAIN            = 0x03;
constexpr uint8_t ATYP_IPV6              = 0x04;

enum class Reply : uint8_t {
    Succeeded               = 0x00,
    GeneralFailure          = 0x01,
    NotAllowed              = 0x02,
    NetworkUnreachable      = 0x03,
    HostUnreachable         = 0x04,
    ConnectionRefused       = 0x05,
    TtlExpired              = 0x06,
    CommandNotSupported     = 0x07,
    AddressTypeNotSupported = 0x08,
};

struct Request {
    uint8_t command = 0;
    std::string host;
    int port = 0;
};

// Reads exactly n bytes into buf; false on EOF/timeout.
using ReadExact = std::function<bool(uint8_t* buf, size_t n)>;

// ── Server side ─────────────────────────────────────────────

// Consume the client greeting. Ok(true) if "no authentication" is offered.
Result<bool> read_greeting(const ReadExact& read);

std::vector<uint8_t> encode_method_selection(uint8_t method);

// Consume a request. Err carries the reply code to send back in `reply`.
Result<Request> read_request(const ReadExact& read, Reply& reply);

// Reply with BND.ADDR 0.0.0.0, BND.PORT 0.
std::vector<uint8_t> encode_reply(Reply code);

// ── Client side ─────────────────────────────────────────────

// Greeting offering only "no authentication".
std::vector<uint8_t> encode_greeting();

// CONNECT request; IP literals use their address type, names use DOMAIN.
std::vector<uint8_t> encode_connect(const std::string& host, int port);

// Consume a server reply (variable-length bound address included).
Result<Reply> read_reply(const ReadExact& read);

} // namespace socks5
