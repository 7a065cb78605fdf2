#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include <filesystem>
#include <core/constants.hpp>
#include <core/entities.hpp>
#include <core/errors.hpp>
#include <core/pool_log.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

class EntityStore;

// A private working copy of the store. Records fetched through get<E>() are
// "touched": commit succeeds only if each touched record still carries the
// version this transaction read.
class Transaction {
public:
    template <typename E> std::vector<E> all() const;
    template <typename E> E& get(EntityId id);

    Credential& credential(EntityId id);
    Port& port(EntityId id);

private:
    friend class EntityStore;

    std::map<EntityId, Credential> credentials_;
    std::map<EntityId, Port> ports_;
    std::map<EntityId, std::uint64_t> touched_credentials_;
    std::map<EntityId, std::uint64_t> touched_ports_;
};

template <> std::vector<Credential> Transaction::all<Credential>() const;
template <> std::vector<Port> Transaction::all<Port>() const;
template <> Credential& Transaction::get<Credential>(EntityId id);
template <> Port& Transaction::get<Port>(EntityId id);

// Durable records for credentials and ports. Reads return snapshots; every
// mutation goes through transact(), a bounded optimistic-retry loop around
// one conditional write.
class EntityStore {
public:
    EntityStore() = default;
    explicit EntityStore(fs::path path);

    // ── Inventory ──────────────────────────────────────────────

    EntityId add_credential(Credential credential);
    EntityId add_port(int port_number);

    // Deleting a credential also clears the link of the port that owns it.
    bool remove_credential(EntityId id);
    bool remove_port(EntityId id);

    // Create a Port for every number not yet present. Never deletes.
    void sync_ports(const std::vector<int>& numbers);

    // ── Queries ────────────────────────────────────────────────

    std::vector<Credential> credentials() const;
    std::vector<Port> ports() const;
    std::optional<Credential> find_credential(EntityId id) const;
    std::optional<Port> find_port(EntityId id) const;

    template <typename E> std::vector<E> all() const;

    // First record matching `pred` under the strict ordering `less`; among
    // equals the lowest id wins.
    template <typename E, typename Pred, typename Less>
    std::optional<E> select_first(Pred pred, Less less) const {
        std::optional<E> best;
        for (auto& row : all<E>()) {
            if (!pred(row)) continue;
            if (!best || less(row, *best)) best = std::move(row);
        }
        return best;
    }

    template <typename E, typename Pred>
    std::optional<E> select_first(Pred pred) const {
        return select_first<E>(pred, [](const E&, const E&) { return false; });
    }

    // ── Transactions ───────────────────────────────────────────

    // Run fn(Transaction&) and commit. On a version conflict the whole
    // function is re-run against a fresh snapshot, up to max_attempts times,
    // then ConflictExhaustedError. EntityVanishedError propagates from fn
    // (missing id) or from commit (record deleted meanwhile).
    template <typename Fn>
    auto transact(Fn&& fn, int max_attempts = STORE_TX_MAX_ATTEMPTS)
        -> decltype(fn(std::declval<Transaction&>())) {
        using R = decltype(fn(std::declval<Transaction&>()));
        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            Transaction tx = begin();
            if constexpr (std::is_void_v<R>) {
                fn(tx);
                if (commit(tx)) return;
            } else {
                R result = fn(tx);
                if (commit(tx)) return result;
            }
            pool_log(fmt::format("store: write conflict (attempt {}/{})", attempt, max_attempts));
        }
        throw ConflictExhaustedError(
            fmt::format("Transaction gave up after {} conflicting attempts", max_attempts));
    }

    // ── Persistence ────────────────────────────────────────────

    // Replace contents with the YAML file at path(). Missing or corrupted
    // file → empty store.
    void load();
    void save();
    bool dirty() const;

    const fs::path& path() const { return path_; }

private:
    Transaction begin() const;
    bool commit(const Transaction& tx);

    mutable std::mutex mutex_;
    std::map<EntityId, Credential> credentials_;
    std::map<EntityId, Port> ports_;
    EntityId next_id_ = 1;
    bool dirty_ = false;
    fs::path path_;
};

template <> std::vector<Credential> EntityStore::all<Credential>() const;
template <> std::vector<Port> EntityStore::all<Port>() const;
