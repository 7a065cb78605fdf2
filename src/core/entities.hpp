#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include "types.hpp"

// Periodic-check bookkeeping shared by every checked record kind.
struct CheckState {
    bool is_checking = false;
    std::optional<TimePoint> last_checked;
};

// SSH identity used to open a tunnel.
struct Credential {
    EntityId id = 0;
    std::uint64_t version = 0;

    std::string host;
    std::string username;
    std::string password;
    bool is_live = false;
    std::optional<EntityId> port;   // owning Port, if assigned

    CheckState check;
};

// Fixed local SOCKS5 endpoint, backed by at most one tunnel.
struct Port {
    EntityId id = 0;
    std::uint64_t version = 0;

    int port_number = 0;
    std::optional<EntityId> credential;
    std::string external_ip;                    // observed through the tunnel
    std::optional<TimePoint> time_connected;
    std::vector<EntityId> used_credentials;     // assignment history

    CheckState check;
};

// Uniform access to the embedded check state.
inline CheckState& check_state(Credential& c) { return c.check; }
inline const CheckState& check_state(const Credential& c) { return c.check; }
inline CheckState& check_state(Port& p) { return p.check; }
inline const CheckState& check_state(const Port& p) { return p.check; }
