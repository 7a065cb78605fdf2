#pragma once

#include <optional>
#include <core/entities.hpp>
#include <core/errors.hpp>
#include <core/pool_log.hpp>
#include <fmt/format.h>
#include "entity_store.hpp"

// Staleness-first round-robin over any record kind exposing a CheckState
// (check_state(e) overloads in core/entities.hpp).

// Smallest non-null last_checked across `rows`, in flight or not.
template <typename E>
std::optional<TimePoint> min_last_checked(const std::vector<E>& rows) {
    std::optional<TimePoint> min;
    for (const auto& row : rows) {
        const auto& last = check_state(row).last_checked;
        if (last && (!min || *last < *min)) min = last;
    }
    return min;
}

// Eligible iff not in flight and either never checked or the globally
// stalest record of its kind.
template <typename E>
bool need_checking(const E& entity, const std::optional<TimePoint>& min_checked) {
    const CheckState& cs = check_state(entity);
    if (cs.is_checking) return false;
    return !cs.last_checked || (min_checked && *cs.last_checked == *min_checked);
}

// Never-checked first, then oldest last_checked; equal keys keep id order.
template <typename E>
bool checked_before(const E& lhs, const E& rhs) {
    const auto& a = check_state(lhs).last_checked;
    const auto& b = check_state(rhs).last_checked;
    if (!a || !b) return !a && b;
    return *a < *b;
}

// Claim the stalest eligible record of kind E: select and set is_checking in
// one transaction. A concurrent claim of the same record is a version
// conflict, so the loser re-selects against fresh data.
template <typename E>
std::optional<E> get_next_needing_check(EntityStore& store) {
    return store.transact([](Transaction& tx) -> std::optional<E> {
        auto rows = tx.all<E>();
        auto min_checked = min_last_checked(rows);

        const E* best = nullptr;
        for (const auto& row : rows) {
            if (!need_checking(row, min_checked)) continue;
            if (!best || checked_before(row, *best)) best = &row;
        }
        if (!best) return std::nullopt;

        E& claimed = tx.get<E>(best->id);
        check_state(claimed).is_checking = true;
        return claimed;
    });
}

// Apply `updates`, clear the in-flight flag and stamp last_checked. A record
// deleted meanwhile is skipped silently; returns false in that case.
template <typename E, typename Fn>
bool complete_check(EntityStore& store, EntityId id, Fn&& updates) {
    try {
        store.transact([&](Transaction& tx) {
            E& entity = tx.get<E>(id);
            updates(entity);
            CheckState& cs = check_state(entity);
            cs.is_checking = false;
            cs.last_checked = Clock::now();
        });
        return true;
    } catch (const EntityVanishedError&) {
        return false;
    }
}

template <typename E>
bool complete_check(EntityStore& store, EntityId id) {
    return complete_check<E>(store, id, [](E&) {});
}

// Back to pristine: not in flight, never checked.
inline void reset_check_state(CheckState& cs) {
    cs.is_checking = false;
    cs.last_checked.reset();
}
