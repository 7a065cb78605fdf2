#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// External IP as seen through a SOCKS5 proxy: CONNECT to the echo service,
// send one HTTP/1.0 GET and read the body. nullopt on any failure.
std::optional<std::string> fetch_external_ip(const std::string& proxy_host, int proxy_port,
                                             const IpCheckConfig& config);

// Body of a 200 response, trimmed, if it is an IP literal.
std::optional<std::string> parse_ip_response(const std::string& http_response);
