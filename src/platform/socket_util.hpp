#pragma once

// Socket utilities.

#include <poll.h>
#include <string>
#include <atomic>

using socket_t = int;
#define SOCKSPOOL_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (IPv4/IPv6 literal or name) and open a non-blocking TCP
// connection, waiting at most timeout_ms. Polls `cancel` between short waits.
// Returns the connected socket, or SOCKSPOOL_INVALID_SOCKET with `error` set.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error,
                     const std::atomic<bool>* cancel = nullptr);

// Bind + listen on address:port. Returns the socket or SOCKSPOOL_INVALID_SOCKET.
socket_t listen_tcp(const std::string& address, int port, int backlog, std::string& error);

// Ask the kernel for an unused local TCP port.
int free_local_port();

// This machine's LAN IPv4 address (hostname lookup), "127.0.0.1" if unknown.
std::string local_ipv4_address();

// Write all bytes, waiting for writability up to timeout_ms per chunk.
bool send_all(socket_t sock, const char* data, size_t len, int timeout_ms);

// Read exactly len bytes, waiting up to timeout_ms per chunk.
bool recv_exact(socket_t sock, char* data, size_t len, int timeout_ms);

} // namespace platform
