#include "assignment.hpp"
#include "check_state.hpp"
#include <algorithm>

bool is_usable(const Credential& credential) {
    return credential.is_live && !credential.port.has_value();
}

bool needs_credential(const Port& port) {
    return !port.credential.has_value();
}

bool in_history(const Port& port, EntityId credential_id) {
    return std::find(port.used_credentials.begin(), port.used_credentials.end(),
                     credential_id) != port.used_credentials.end();
}

bool is_due_for_rotation(const Port& port, std::chrono::seconds max_age, TimePoint now) {
    if (!port.credential || !port.time_connected) return false;
    return *port.time_connected < now - max_age;
}

std::optional<Credential> pick_credential_for_port(const EntityStore& store, const Port& port,
                                                   bool enforce_uniqueness) {
    return store.select_first<Credential>([&](const Credential& c) {
        if (!is_usable(c)) return false;
        return !(enforce_uniqueness && in_history(port, c.id));
    });
}

std::optional<Port> pick_port_needing_credential(const EntityStore& store) {
    return store.select_first<Port>(needs_credential);
}

std::vector<Port> find_ports_due_for_rotation(const EntityStore& store,
                                              std::chrono::seconds max_age, TimePoint now) {
    std::vector<Port> due;
    for (auto& port : store.ports()) {
        if (is_due_for_rotation(port, max_age, now)) due.push_back(std::move(port));
    }
    return due;
}

void link_credential(Port& port, Credential& credential, TimePoint now) {
    port.credential = credential.id;
    port.time_connected = now;
    if (!in_history(port, credential.id)) {
        port.used_credentials.push_back(credential.id);
    }
    credential.port = port.id;
}

void unlink_credential(Port& port, Credential& credential, bool purge_from_history) {
    port.credential.reset();
    if (credential.port == port.id) credential.port.reset();
    if (purge_from_history) {
        auto& used = port.used_credentials;
        used.erase(std::remove(used.begin(), used.end(), credential.id), used.end());
    }
}

void reset_port_status(Port& port) {
    reset_check_state(port.check);
    port.external_ip.clear();
    port.credential.reset();
    port.time_connected.reset();
    port.used_credentials.clear();
}

void reset_credential_status(Credential& credential) {
    reset_check_state(credential.check);
    credential.port.reset();
}

bool assign(EntityStore& store, EntityId port_id, EntityId credential_id) {
    return store.transact([&](Transaction& tx) {
        Port& port = tx.port(port_id);
        Credential& credential = tx.credential(credential_id);
        if (!needs_credential(port) || !is_usable(credential)) return false;
        link_credential(port, credential, Clock::now());
        return true;
    });
}

std::optional<EntityId> unassign(EntityStore& store, EntityId port_id, bool purge_from_history,
                                 std::optional<EntityId> expected_credential) {
    return store.transact([&](Transaction& tx) -> std::optional<EntityId> {
        Port& port = tx.port(port_id);
        if (!port.credential) return std::nullopt;
        if (expected_credential && *port.credential != *expected_credential) return std::nullopt;

        EntityId credential_id = *port.credential;
        auto rows = tx.all<Credential>();
        bool exists = std::any_of(rows.begin(), rows.end(),
                                  [&](const Credential& c) { return c.id == credential_id; });
        if (!exists) {
            port.credential.reset();
            if (purge_from_history) {
                auto& used = port.used_credentials;
                used.erase(std::remove(used.begin(), used.end(), credential_id), used.end());
            }
            return credential_id;
        }

        unlink_credential(port, tx.credential(credential_id), purge_from_history);
        return credential_id;
    });
}

void reset_port(EntityStore& store, EntityId port_id) {
    store.transact([&](Transaction& tx) {
        Port& port = tx.port(port_id);
        if (port.credential) {
            auto rows = tx.all<Credential>();
            for (const auto& c : rows) {
                if (c.id == *port.credential) {
                    tx.credential(c.id).port.reset();
                    break;
                }
            }
        }
        reset_port_status(port);
    });
}

void reset_all(EntityStore& store) {
    store.transact([](Transaction& tx) {
        for (const auto& p : tx.all<Port>()) {
            reset_port_status(tx.port(p.id));
        }
        for (const auto& c : tx.all<Credential>()) {
            reset_credential_status(tx.credential(c.id));
        }
    });
}
