#pragma once

#include <chrono>
#include <string>
#include <core/entities.hpp>
#include <managers/entity_store.hpp>

inline Credential make_credential(const std::string& host, bool is_live = true,
                                  const std::string& username = "root",
                                  const std::string& password = "secret") {
    Credential c;
    c.host = host;
    c.username = username;
    c.password = password;
    c.is_live = is_live;
    return c;
}

inline TimePoint minutes_ago(int minutes, TimePoint now = Clock::now()) {
    return now - std::chrono::minutes(minutes);
}

// Stamp last_checked directly, outside the check protocol.
inline void set_last_checked(EntityStore& store, EntityId id, std::optional<TimePoint> when) {
    store.transact([&](Transaction& tx) { tx.credential(id).check.last_checked = when; });
}

inline void set_port_last_checked(EntityStore& store, EntityId id, std::optional<TimePoint> when) {
    store.transact([&](Transaction& tx) { tx.port(id).check.last_checked = when; });
}
