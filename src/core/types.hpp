#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using EntityId = std::int64_t;

// ── Configuration structures ────────────────────────────────

struct SshPoolConfig {
    int tasks_count = 20;
    int connection_timeout = 20;          // seconds, TCP connect + handshake
    int login_timeout = 15;               // seconds, authentication
    std::vector<int> candidate_ports;     // empty → port 22
};

struct PortPoolConfig {
    int tasks_count = 20;
    bool use_unique_ssh = true;           // skip credentials already in a port's history
    bool auto_reset_ports = true;         // rotate assignments
    int reset_interval = 60;              // seconds a port may keep one credential
    std::vector<int> numbers;             // fixed proxy port set
    std::string bind_address = "0.0.0.0";
};

struct IpCheckConfig {
    std::string host = "api.ipify.org";
    int port = 80;
    std::string path = "/";
    int timeout = 10;
};

struct SchedulerConfig {
    int idle_sleep_ms = 1000;
    int flush_interval = 5;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
