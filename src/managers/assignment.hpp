#pragma once

#include <chrono>
#include <optional>
#include <vector>
#include <core/entities.hpp>
#include "entity_store.hpp"

// ── Predicates ──────────────────────────────────────────────

// Live and not owned by any port.
bool is_usable(const Credential& credential);

// No credential assigned.
bool needs_credential(const Port& port);

bool in_history(const Port& port, EntityId credential_id);

// Assigned and connected for longer than max_age.
bool is_due_for_rotation(const Port& port, std::chrono::seconds max_age,
                         TimePoint now = Clock::now());

// ── Selection ───────────────────────────────────────────────

// Any usable credential, lowest id first. With enforce_uniqueness, skips
// credentials in this port's own history (other ports' history is ignored).
std::optional<Credential> pick_credential_for_port(const EntityStore& store, const Port& port,
                                                   bool enforce_uniqueness);

// First port (by id) without a credential.
std::optional<Port> pick_port_needing_credential(const EntityStore& store);

std::vector<Port> find_ports_due_for_rotation(const EntityStore& store,
                                              std::chrono::seconds max_age,
                                              TimePoint now = Clock::now());

// ── Bookkeeping (inside a transaction) ──────────────────────

// Link both sides, stamp time_connected, append to history.
void link_credential(Port& port, Credential& credential, TimePoint now);

// Clear both sides of the link; optionally drop the credential from history.
void unlink_credential(Port& port, Credential& credential, bool purge_from_history);

void reset_port_status(Port& port);
void reset_credential_status(Credential& credential);

// ── Store operations ────────────────────────────────────────

// Record that `credential_id` now serves `port_id`. The tunnel must already
// be up. Returns false (no change) if the port got a credential or the
// credential stopped being usable in the meantime.
bool assign(EntityStore& store, EntityId port_id, EntityId credential_id);

// Drop the port's current credential, if any. With expected_credential set,
// only if that is still the one assigned. A credential deleted in the
// meantime only clears the port side. Returns the credential id released.
std::optional<EntityId> unassign(EntityStore& store, EntityId port_id,
                                 bool purge_from_history = false,
                                 std::optional<EntityId> expected_credential = std::nullopt);

// reset_port_status on one port, releasing its credential.
void reset_port(EntityStore& store, EntityId port_id);

// Startup/administrative reset: every port pristine, every credential's
// in-flight flag, timestamp and port link cleared. Liveness is kept.
void reset_all(EntityStore& store);
