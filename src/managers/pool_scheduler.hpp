#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/entities.hpp>
#include "entity_store.hpp"
#include "tunnel_manager.hpp"

// Two worker pools over one store: credential checkers (liveness) and port
// keepers (assignment, health, rotation). Plus a flusher that persists the
// store periodically.
class PoolScheduler {
public:
    PoolScheduler(EntityStore& store, TunnelManager& tunnels, const Config& config);
    ~PoolScheduler();

    PoolScheduler(const PoolScheduler&) = delete;
    PoolScheduler& operator=(const PoolScheduler&) = delete;

    // Reset state left by a previous run, create configured ports and spawn
    // ssh.tasks_count + port.tasks_count workers.
    void start();

    // Join every worker, close all tunnels and save the store. Idempotent.
    void stop();

    bool is_running() const { return running_; }

    // One pull-and-act cycle. False if nothing was eligible.
    bool run_credential_step();
    bool run_port_step();

private:
    EntityStore& store_;
    TunnelManager& tunnels_;
    const Config& config_;

    std::atomic<bool> running_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::vector<std::thread> workers_;
    std::thread flusher_;

    void credential_worker(int index);
    void port_worker(int index);
    void flush_loop();

    // Sleep up to ms, waking early on stop(). False once stopped.
    bool wait_for(int ms);

    // Assigned port: rotate or drop it if the tunnel is gone. Returns the
    // external IP to record ("" once released).
    std::string maintain_assignment(const Port& port);

    // Unassigned port: pick a credential, bring its tunnel up on the port
    // number and record the assignment. Returns the external IP or "".
    std::string acquire_credential(const Port& port);

    // Tear down the port's tunnel (if any) and unassign it, unless its
    // credential changed since `port` was read.
    void release(const Port& port, bool purge_from_history);

    // Unassign the port a dead credential still serves and close its
    // tunnel, only while both still belong to that credential.
    void release_dead_credential(const Credential& cred);

    void finish_credential(EntityId id, bool is_live);
    void finish_port(EntityId id, const std::string& external_ip);
};
