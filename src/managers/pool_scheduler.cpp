#include "pool_scheduler.hpp"
#include "assignment.hpp"
#include "check_state.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/pool_log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <thread>

PoolScheduler::PoolScheduler(EntityStore& store, TunnelManager& tunnels, const Config& config)
    : store_(store), tunnels_(tunnels), config_(config), running_(false) {}

PoolScheduler::~PoolScheduler() {
    stop();
}

// ── Lifecycle ─────────────────────────────────────────────

void PoolScheduler::start() {
    if (running_) return;

    // The tunnel registry starts empty, so nothing persisted as assigned
    // or in flight is true anymore
    reset_all(store_);
    store_.sync_ports(config_.port().numbers);

    running_ = true;
    for (int i = 0; i < config_.ssh().tasks_count; i++) {
        workers_.emplace_back(&PoolScheduler::credential_worker, this, i);
    }
    for (int i = 0; i < config_.port().tasks_count; i++) {
        workers_.emplace_back(&PoolScheduler::port_worker, this, i);
    }
    flusher_ = std::thread(&PoolScheduler::flush_loop, this);

    pool_log(fmt::format("scheduler: started {} credential workers, {} port workers",
                         config_.ssh().tasks_count, config_.port().tasks_count));
}

void PoolScheduler::stop() {
    bool was_running = running_.exchange(false);
    wait_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    if (flusher_.joinable()) flusher_.join();

    if (!was_running) return;

    tunnels_.teardown_all();
    try {
        store_.save();
    } catch (const std::exception& e) {
        pool_log(fmt::format("scheduler: final save failed: {}", e.what()));
    }
    pool_log("scheduler: stopped");
}

bool PoolScheduler::wait_for(int ms) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return !running_; });
    return running_;
}

// ── Worker loops ──────────────────────────────────────────

void PoolScheduler::credential_worker(int index) {
    while (running_) {
        bool did_work = false;
        try {
            did_work = run_credential_step();
        } catch (const std::exception& e) {
            pool_log(fmt::format("credential worker {}: {}", index, e.what()));
        }
        if (!did_work && !wait_for(config_.scheduler().idle_sleep_ms)) break;
    }
}

void PoolScheduler::port_worker(int index) {
    while (running_) {
        bool did_work = false;
        try {
            did_work = run_port_step();
        } catch (const std::exception& e) {
            pool_log(fmt::format("port worker {}: {}", index, e.what()));
        }
        if (!did_work && !wait_for(config_.scheduler().idle_sleep_ms)) break;
    }
}

void PoolScheduler::flush_loop() {
    while (wait_for(config_.scheduler().flush_interval * 1000)) {
        if (!store_.dirty()) continue;
        try {
            store_.save();
        } catch (const std::exception& e) {
            pool_log(fmt::format("scheduler: store flush failed: {}", e.what()));
        }
    }
}

// ── Credential step ───────────────────────────────────────

bool PoolScheduler::run_credential_step() {
    auto claimed = get_next_needing_check<Credential>(store_);
    if (!claimed) return false;

    const Credential& cred = *claimed;
    bool live = false;
    try {
        live = tunnels_.verify_only(cred.host, cred.username, cred.password);
    } catch (const std::exception& e) {
        pool_log(fmt::format("{}: check failed: {}", cred.host, e.what()));
    }
    finish_credential(cred.id, live);
    if (!live) release_dead_credential(cred);
    return true;
}

void PoolScheduler::release_dead_credential(const Credential& cred) {
    auto current = store_.find_credential(cred.id);
    if (!current || !current->port) return;
    auto port = store_.find_port(*current->port);
    if (!port || port->credential != cred.id) return;

    // The port is not claimed by this worker: its own worker may have moved
    // it to another credential since the read above
    if (!unassign(store_, port->id, true, cred.id)) return;
    tunnels_.teardown_if(port->port_number, cred.host, cred.username);
    pool_log(fmt::format("{}: dead, released port {}", cred.host, port->port_number));
}

void PoolScheduler::finish_credential(EntityId id, bool is_live) {
    for (int attempt = 1;; attempt++) {
        try {
            complete_check<Credential>(store_, id, [is_live](Credential& c) { c.is_live = is_live; });
            return;
        } catch (const ConflictExhaustedError& e) {
            pool_log(fmt::format("credential {}: {}", id, e.what()));
            // An in-flight record is never selected again until restart
            if (!running_ && attempt >= STORE_TX_MAX_ATTEMPTS) return;
            std::this_thread::yield();
        }
    }
}

// ── Port step ─────────────────────────────────────────────

bool PoolScheduler::run_port_step() {
    auto claimed = get_next_needing_check<Port>(store_);
    if (!claimed) return false;

    const Port& port = *claimed;
    std::string external_ip;
    try {
        if (port.credential) external_ip = maintain_assignment(port);

        auto fresh = store_.find_port(port.id);
        if (fresh && needs_credential(*fresh)) external_ip = acquire_credential(*fresh);
    } catch (const std::exception& e) {
        pool_log(fmt::format("port {}: {}", port.port_number, e.what()));
    }

    finish_port(port.id, external_ip);
    return true;
}

std::string PoolScheduler::maintain_assignment(const Port& port) {
    const auto& cfg = config_.port();
    if (cfg.auto_reset_ports &&
        is_due_for_rotation(port, std::chrono::seconds(cfg.reset_interval))) {
        pool_log(fmt::format("port {}: rotating", port.port_number));
        release(port, false);
        return "";
    }

    if (!tunnels_.is_alive(port.port_number)) {
        pool_log(fmt::format("port {}: tunnel lost", port.port_number));
        release(port, true);
        return "";
    }

    auto ip = tunnels_.probe_external_ip(port.port_number);
    if (!ip) {
        pool_log(fmt::format("port {}: proxy not responding", port.port_number));
        release(port, true);
        return "";
    }
    return *ip;
}

std::string PoolScheduler::acquire_credential(const Port& port) {
    auto cred = pick_credential_for_port(store_, port, config_.port().use_unique_ssh);
    if (!cred) return "";

    TunnelInfo info;
    try {
        info = tunnels_.establish(cred->host, cred->username, cred->password, port.port_number);
    } catch (const TunnelError&) {
        return "";  // logged by the tunnel manager; retried next cycle
    }

    bool assigned = false;
    try {
        assigned = assign(store_, port.id, cred->id);
    } catch (const std::exception&) {
        try {
            tunnels_.teardown_by_port(port.port_number);
        } catch (const NotFoundError&) {
        }
        throw;
    }
    if (!assigned) {
        // Lost the credential (or the port) to another worker
        try {
            tunnels_.teardown_by_port(port.port_number);
        } catch (const NotFoundError&) {
        }
        return "";
    }
    return info.external_ip;
}

void PoolScheduler::release(const Port& port, bool purge_from_history) {
    try {
        tunnels_.teardown_by_port(port.port_number);
    } catch (const NotFoundError&) {
    }
    unassign(store_, port.id, purge_from_history, port.credential);
}

void PoolScheduler::finish_port(EntityId id, const std::string& external_ip) {
    for (int attempt = 1;; attempt++) {
        try {
            complete_check<Port>(store_, id, [&external_ip](Port& p) {
                p.external_ip = p.credential ? external_ip : "";
            });
            return;
        } catch (const ConflictExhaustedError& e) {
            pool_log(fmt::format("port {}: {}", id, e.what()));
            if (!running_ && attempt >= STORE_TX_MAX_ATTEMPTS) return;
            std::this_thread::yield();
        }
    }
}
